#pragma once

#include <string>
#include <string_view>

namespace mailhub::codec {

// Base64 without line breaks, as used by SMTP AUTH.
std::string base64_encode(std::string_view data);
std::string base64_decode(std::string_view encoded);

// Transparency for a line-oriented data block terminated by ".".
std::string stuff_line(std::string_view line);
std::string unstuff_line(std::string_view line);

// Splits text into lines (LF or CRLF), dot-stuffs each one and joins them
// with CRLF. The result always ends with CRLF unless text is empty.
std::string stuff_text(std::string_view text);

// Converts bare LF line endings to CRLF.
std::string to_crlf(std::string_view text);

}  // namespace mailhub::codec
