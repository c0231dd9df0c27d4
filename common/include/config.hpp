#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <cstdint>

namespace mailhub {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;
    std::string hostname = "localhost";
    size_t thread_pool_size = 8;
    std::chrono::seconds idle_timeout{600};
    size_t max_auth_attempts = 3;
};

struct StorageConfig {
    std::filesystem::path root = "/var/lib/mailhub/mail";
    std::filesystem::path accounts_db = "/var/lib/mailhub/accounts.db";
};

struct LogConfig {
    enum class Level { Trace, Debug, Info, Warning, Error, Fatal };
    Level level = Level::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    bool log_to_file = false;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

struct SMTPConfig : ServerConfig {
    size_t max_message_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_recipients = 100;
    bool require_auth = false;

    SMTPConfig() {
        port = 2525;
    }
};

struct POP3Config : ServerConfig {
    POP3Config() {
        port = 1100;
    }
};

class Config {
public:
    Config() = default;

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    const StorageConfig& storage() const { return storage_; }
    const LogConfig& log() const { return log_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const POP3Config& pop3() const { return pop3_; }

    StorageConfig& storage() { return storage_; }
    LogConfig& log() { return log_; }
    SMTPConfig& smtp() { return smtp_; }
    POP3Config& pop3() { return pop3_; }

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

private:
    void parse_section(const std::string& section, const std::string& key, const std::string& value);
    bool parse_server_key(ServerConfig& server, const std::string& key, const std::string& value);

    StorageConfig storage_;
    LogConfig log_;
    SMTPConfig smtp_;
    POP3Config pop3_;

    std::unordered_map<std::string, std::string> custom_values_;
};

}  // namespace mailhub
