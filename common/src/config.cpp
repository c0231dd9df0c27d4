#include "config.hpp"
#include "logger.hpp"
#include "strings.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <charconv>
#include <cctype>

namespace mailhub {

namespace {

using strings::lower;

constexpr std::string_view kWhitespace = " \t\r\n";

std::string trim(std::string_view s) {
    return strings::trim(s, kWhitespace);
}

bool to_bool(const std::string& v) {
    auto l = lower(v);
    return l == "true" || l == "yes" || l == "1" || l == "on";
}

std::optional<uint64_t> to_uint(const std::string& v) {
    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return result;
}

// Assigns a numeric setting, keeping the default when the value is malformed.
template<typename T>
void assign_number(T& target, const std::string& key, const std::string& value) {
    if (auto n = to_uint(value)) {
        target = static_cast<T>(*n);
    } else {
        LOG_WARNING_FMT("Ignoring non-numeric value '{}' for {}", value, key);
    }
}

}  // namespace

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = lower(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = lower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        parse_section(current_section, key, value);
    }

    return true;
}

bool Config::parse_server_key(ServerConfig& server, const std::string& key,
                              const std::string& value) {
    if (key == "bind_address" || key == "address") {
        server.bind_address = value;
    } else if (key == "port") {
        assign_number(server.port, key, value);
    } else if (key == "hostname") {
        server.hostname = value;
    } else if (key == "thread_pool_size" || key == "workers") {
        assign_number(server.thread_pool_size, key, value);
    } else if (key == "idle_timeout") {
        uint64_t seconds = static_cast<uint64_t>(server.idle_timeout.count());
        assign_number(seconds, key, value);
        server.idle_timeout = std::chrono::seconds(seconds);
    } else if (key == "max_auth_attempts") {
        assign_number(server.max_auth_attempts, key, value);
    } else {
        return false;
    }
    return true;
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    if (section == "storage") {
        if (key == "root" || key == "mail_root") {
            storage_.root = value;
            return;
        } else if (key == "accounts_db" || key == "database") {
            storage_.accounts_db = value;
            return;
        }
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            std::string level = lower(value);
            if (level == "trace") log_.level = LogConfig::Level::Trace;
            else if (level == "debug") log_.level = LogConfig::Level::Debug;
            else if (level == "info") log_.level = LogConfig::Level::Info;
            else if (level == "warning" || level == "warn") log_.level = LogConfig::Level::Warning;
            else if (level == "error") log_.level = LogConfig::Level::Error;
            else if (level == "fatal") log_.level = LogConfig::Level::Fatal;
            return;
        } else if (key == "file") {
            log_.file = value;
            log_.log_to_file = !value.empty();
            return;
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
            return;
        } else if (key == "max_file_size") {
            assign_number(log_.max_file_size, key, value);
            return;
        } else if (key == "max_files") {
            assign_number(log_.max_files, key, value);
            return;
        }
    } else if (section == "smtp") {
        if (parse_server_key(smtp_, key, value)) {
            return;
        } else if (key == "max_message_size") {
            assign_number(smtp_.max_message_size, key, value);
            return;
        } else if (key == "max_recipients") {
            assign_number(smtp_.max_recipients, key, value);
            return;
        } else if (key == "require_auth") {
            smtp_.require_auth = to_bool(value);
            return;
        }
    } else if (section == "pop3") {
        if (parse_server_key(pop3_, key, value)) {
            return;
        }
    }

    std::string full_key = section.empty() ? key : section + "." + key;
    custom_values_[full_key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Config::set(const std::string& key, const std::string& value) {
    custom_values_[key] = value;
}

}  // namespace mailhub
