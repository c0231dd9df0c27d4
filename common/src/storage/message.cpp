#include "storage/message.hpp"
#include "codec.hpp"
#include "strings.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace mailhub {

namespace {

using strings::lower;
using strings::trim;

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

std::vector<std::string> split_addresses(const std::string& value) {
    std::vector<std::string> result;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// Splits on LF, dropping a trailing CR from each line.
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        std::string line = eol == std::string::npos ? text.substr(pos) : text.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return lines;
}

bool is_continuation(const std::string& line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

bool is_header_line(const std::string& line) {
    if (is_continuation(line)) return true;
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    for (size_t i = 0; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c <= 32 || c >= 127) return false;
    }
    return true;
}

// Headers the canonical rendering writes itself.
bool is_generated_header(const std::string& name) {
    return name == "from" || name == "to" || name == "cc" || name == "subject" ||
           name == "date" || name == "message-id";
}

std::string header_name(const std::string& line) {
    return lower(line.substr(0, line.find(':')));
}

std::string header_value(const std::string& line) {
    auto colon = line.find(':');
    return colon == std::string::npos ? "" : trim(line.substr(colon + 1));
}

std::chrono::system_clock::time_point now_seconds() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

}  // namespace

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);
    return fmt::format("{:%a, %d %b %Y %H:%M:%S} +0000", tm_utc);
}

std::optional<std::chrono::system_clock::time_point> parse_date(const std::string& value) {
    std::tm tm_utc{};
    std::istringstream iss(value);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm_utc, "%a, %d %b %Y %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_utc));
}

std::string Message::header_block() const {
    std::string out;
    out += "From: " + sender + "\r\n";
    out += "To: " + join(to) + "\r\n";
    if (!cc.empty()) {
        out += "Cc: " + join(cc) + "\r\n";
    }
    out += "Subject: " + subject + "\r\n";
    out += "Date: " + format_date(created_at) + "\r\n";
    out += "Message-ID: <" + id + ">\r\n";
    for (const auto& line : extra_headers) {
        out += line + "\r\n";
    }
    return out;
}

std::string Message::render() const {
    std::string text = codec::to_crlf(body);
    if (!text.empty() && text.back() != '\n') {
        text += "\r\n";
    }
    return header_block() + "\r\n" + text;
}

std::vector<std::string> Message::recipients() const {
    std::vector<std::string> all;
    for (const auto* list : {&to, &cc, &bcc}) {
        for (const auto& addr : *list) {
            if (std::find(all.begin(), all.end(), addr) == all.end()) {
                all.push_back(addr);
            }
        }
    }
    return all;
}

Message Message::create(const std::string& sender,
                        const std::vector<std::string>& to,
                        const std::string& subject,
                        const std::string& body) {
    Message msg;
    msg.sender = sender;
    msg.to = to;
    msg.subject = subject;
    msg.body = body;
    msg.created_at = now_seconds();
    return msg;
}

Message Message::from_payload(const std::string& payload,
                              const std::string& sender,
                              const std::vector<std::string>& recipients) {
    Message msg = create(sender, recipients, "", "");

    auto lines = split_lines(payload);
    auto blank = std::find(lines.begin(), lines.end(), std::string());

    bool has_headers = !lines.empty() &&
        std::all_of(lines.begin(), blank, is_header_line) &&
        !is_continuation(lines.front()) && lines.begin() != blank;

    if (!has_headers) {
        msg.body = payload;
        return msg;
    }

    enum class Current { Subject, Extra, Dropped };
    Current current = Current::Dropped;
    for (auto it = lines.begin(); it != blank; ++it) {
        const std::string& line = *it;
        if (is_continuation(line)) {
            if (current == Current::Extra) {
                msg.extra_headers.push_back(line);
            } else if (current == Current::Subject) {
                // Folded Subject is unfolded onto one line.
                msg.subject += " " + trim(line);
            }
            continue;
        }

        std::string name = header_name(line);
        if (name == "subject") {
            msg.subject = header_value(line);
            current = Current::Subject;
        } else if (is_generated_header(name)) {
            current = Current::Dropped;
        } else {
            msg.extra_headers.push_back(line);
            current = Current::Extra;
        }
    }

    std::string body;
    if (blank != lines.end()) {
        for (auto it = blank + 1; it != lines.end(); ++it) {
            body += *it + "\r\n";
        }
    }
    msg.body = body;
    return msg;
}

std::optional<Message> Message::parse(const std::string& id, const std::string& rendering) {
    size_t split = rendering.find("\r\n\r\n");
    size_t body_start = split == std::string::npos ? std::string::npos : split + 4;
    if (split == std::string::npos) {
        split = rendering.find("\n\n");
        body_start = split == std::string::npos ? std::string::npos : split + 2;
    }
    if (split == std::string::npos) {
        return std::nullopt;
    }

    Message msg;
    msg.id = id;
    msg.body = rendering.substr(body_start);

    bool has_date = false;
    for (const auto& line : split_lines(rendering.substr(0, split))) {
        if (is_continuation(line)) {
            msg.extra_headers.push_back(line);
            continue;
        }

        std::string name = header_name(line);
        std::string value = header_value(line);
        if (name == "from") {
            msg.sender = value;
        } else if (name == "to") {
            msg.to = split_addresses(value);
        } else if (name == "cc") {
            msg.cc = split_addresses(value);
        } else if (name == "subject") {
            msg.subject = value;
        } else if (name == "date") {
            if (auto tp = parse_date(value)) {
                msg.created_at = *tp;
                has_date = true;
            }
        } else if (name == "message-id") {
            // The file name is authoritative.
        } else {
            msg.extra_headers.push_back(line);
        }
    }

    if (msg.sender.empty() || msg.to.empty() || !has_date) {
        return std::nullopt;
    }
    return msg;
}

}  // namespace mailhub
