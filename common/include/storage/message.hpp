#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace mailhub {

struct Message {
    std::string id;
    std::string sender;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;   // delivered to, never rendered
    std::string subject;
    std::string body;
    std::vector<std::string> extra_headers;  // raw pass-through lines
    std::chrono::system_clock::time_point created_at;
    bool read = false;

    // Header lines, each CRLF terminated, without the separating blank line.
    std::string header_block() const;

    // Canonical rendering: header block, blank line, body with CRLF line ends.
    // A non-empty body always ends with CRLF.
    std::string render() const;

    // Byte length of render(). Always recomputed.
    size_t size() const { return render().size(); }

    // to, cc and bcc in that order with exact duplicates removed.
    std::vector<std::string> recipients() const;

    static Message create(const std::string& sender,
                          const std::vector<std::string>& to,
                          const std::string& subject,
                          const std::string& body);

    // Builds a message from an unstuffed SMTP payload. Only Subject is
    // extracted; headers the rendering does not generate pass through.
    static Message from_payload(const std::string& payload,
                                const std::string& sender,
                                const std::vector<std::string>& recipients);

    // Parses a canonical rendering read back from a folder file.
    static std::optional<Message> parse(const std::string& id, const std::string& rendering);
};

std::string format_date(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_date(const std::string& value);

}  // namespace mailhub
