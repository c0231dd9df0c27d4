#include "codec.hpp"
#include <vector>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

namespace mailhub::codec {

std::string base64_encode(std::string_view data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(bio);

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio, &buffer);

    std::string result(buffer->data, buffer->length);
    BIO_free_all(bio);

    return result;
}

std::string base64_decode(std::string_view encoded) {
    if (encoded.empty()) return "";

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::vector<char> decoded(encoded.size());
    int len = BIO_read(bio, decoded.data(), static_cast<int>(decoded.size()));
    BIO_free_all(bio);

    if (len > 0) {
        return std::string(decoded.data(), static_cast<size_t>(len));
    }
    return "";
}

std::string stuff_line(std::string_view line) {
    if (!line.empty() && line.front() == '.') {
        return "." + std::string(line);
    }
    return std::string(line);
}

std::string unstuff_line(std::string_view line) {
    if (!line.empty() && line.front() == '.') {
        line.remove_prefix(1);
    }
    return std::string(line);
}

std::string stuff_text(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 32 + 2);

    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        std::string_view line = eol == std::string_view::npos
            ? text.substr(pos)
            : text.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        out += stuff_line(line);
        out += "\r\n";

        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }

    return out;
}

std::string to_crlf(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 32);

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            out += '\r';
        }
        out += text[i];
    }
    return out;
}

}  // namespace mailhub::codec
