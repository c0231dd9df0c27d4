#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include <mutex>
#include <cstdint>

struct sqlite3;
struct sqlite3_stmt;

namespace mailhub {

struct Account {
    int64_t id = 0;
    std::string username;
    std::string address;
    std::string created_at;
};

// Durable account records and credentials, backed by SQLite.
class AccountRegistry {
public:
    static constexpr int kDefaultIterations = 100000;

    explicit AccountRegistry(const std::filesystem::path& db_path,
                             int pbkdf2_iterations = kDefaultIterations);
    ~AccountRegistry();

    AccountRegistry(const AccountRegistry&) = delete;
    AccountRegistry& operator=(const AccountRegistry&) = delete;

    bool initialize();

    // identifier is either the username or the address
    bool authenticate(const std::string& identifier, const std::string& password);

    bool create_account(const std::string& username, const std::string& address,
                        const std::string& password);
    bool change_password(const std::string& identifier, const std::string& new_password);

    std::optional<Account> get_account(const std::string& identifier);
    std::vector<Account> list_accounts();

    std::string last_error() const;

private:
    bool execute_sql(const std::string& sql);
    bool create_tables();
    Account read_row(sqlite3_stmt* stmt) const;

    std::string hash_password(const std::string& password) const;
    static bool verify_password(const std::string& password, const std::string& hash);

    std::filesystem::path db_path_;
    int iterations_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
    mutable std::mutex mutex_;
};

}  // namespace mailhub
