#include "auth/account_registry.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace mailhub {

namespace {

constexpr int kKeyLength = 32;
constexpr size_t kSaltLength = 16;
constexpr std::string_view kHashScheme = "$pbkdf2-sha256$";

std::string to_hex(const unsigned char* data, size_t length) {
    std::ostringstream oss;
    for (size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::optional<std::string> derive_key(const std::string& password, const std::string& salt,
                                      int iterations) {
    unsigned char derived_key[kKeyLength];
    int ok = PKCS5_PBKDF2_HMAC(
        password.c_str(), static_cast<int>(password.length()),
        reinterpret_cast<const unsigned char*>(salt.c_str()), static_cast<int>(salt.length()),
        iterations,
        EVP_sha256(),
        kKeyLength, derived_key);
    if (ok != 1) {
        return std::nullopt;
    }
    return to_hex(derived_key, kKeyLength);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Owns a prepared statement for the duration of one query.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

AccountRegistry::AccountRegistry(const std::filesystem::path& db_path, int pbkdf2_iterations)
    : db_path_(db_path), iterations_(pbkdf2_iterations) {
}

AccountRegistry::~AccountRegistry() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool AccountRegistry::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto parent = db_path_.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            last_error_ = "Cannot create " + parent.string() + ": " + ec.message();
            LOG_ERROR(last_error_);
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.string().c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("Cannot open database: ") + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    execute_sql("PRAGMA journal_mode=WAL;");

    return create_tables();
}

bool AccountRegistry::create_tables() {
    const char* accounts_table = R"(
        CREATE TABLE IF NOT EXISTS accounts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT UNIQUE NOT NULL,
            address TEXT UNIQUE NOT NULL,
            password_hash TEXT NOT NULL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
    )";

    return execute_sql(accounts_table);
}

bool AccountRegistry::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("SQL error: ") + (err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        LOG_ERROR(last_error_);
        return false;
    }
    return true;
}

Account AccountRegistry::read_row(sqlite3_stmt* stmt) const {
    Account account;
    account.id = sqlite3_column_int64(stmt, 0);
    account.username = column_text(stmt, 1);
    account.address = column_text(stmt, 2);
    account.created_at = column_text(stmt, 3);
    return account;
}

bool AccountRegistry::authenticate(const std::string& identifier, const std::string& password) {
    std::string stored_hash;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return false;

        Statement stmt(db_, "SELECT password_hash FROM accounts WHERE username = ? OR address = ?;");
        if (!stmt) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
        stmt.bind(1, identifier);
        stmt.bind(2, identifier);

        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return false;
        }
        stored_hash = column_text(stmt.get(), 0);
    }

    // Key derivation runs outside the lock.
    return verify_password(password, stored_hash);
}

bool AccountRegistry::create_account(const std::string& username, const std::string& address,
                                     const std::string& password) {
    std::string password_hash = hash_password(password);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "Database not initialized";
        return false;
    }
    if (password_hash.empty()) {
        last_error_ = "Password hashing failed";
        return false;
    }

    // A username must not collide with another account's address and vice versa.
    {
        Statement check(db_, "SELECT 1 FROM accounts WHERE username IN (?, ?) OR address IN (?, ?);");
        if (!check) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
        check.bind(1, username);
        check.bind(2, address);
        check.bind(3, username);
        check.bind(4, address);
        if (sqlite3_step(check.get()) == SQLITE_ROW) {
            last_error_ = "Account already exists: " + username;
            return false;
        }
    }

    Statement stmt(db_, "INSERT INTO accounts (username, address, password_hash) VALUES (?, ?, ?);");
    if (!stmt) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    stmt.bind(1, username);
    stmt.bind(2, address);
    stmt.bind(3, password_hash);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

bool AccountRegistry::change_password(const std::string& identifier, const std::string& new_password) {
    std::string password_hash = hash_password(new_password);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || password_hash.empty()) return false;

    Statement stmt(db_, "UPDATE accounts SET password_hash = ? WHERE username = ? OR address = ?;");
    if (!stmt) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    stmt.bind(1, password_hash);
    stmt.bind(2, identifier);
    stmt.bind(3, identifier);

    bool result = (sqlite3_step(stmt.get()) == SQLITE_DONE);
    if (!result) {
        last_error_ = sqlite3_errmsg(db_);
    }
    return result && sqlite3_changes(db_) > 0;
}

std::optional<Account> AccountRegistry::get_account(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    Statement stmt(db_, "SELECT id, username, address, created_at "
                        "FROM accounts WHERE username = ? OR address = ?;");
    if (!stmt) {
        return std::nullopt;
    }
    stmt.bind(1, identifier);
    stmt.bind(2, identifier);

    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return read_row(stmt.get());
    }
    return std::nullopt;
}

std::vector<Account> AccountRegistry::list_accounts() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return {};

    Statement stmt(db_, "SELECT id, username, address, created_at FROM accounts ORDER BY username;");
    if (!stmt) {
        last_error_ = sqlite3_errmsg(db_);
        return {};
    }

    std::vector<Account> accounts;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        accounts.push_back(read_row(stmt.get()));
    }
    return accounts;
}

std::string AccountRegistry::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string AccountRegistry::hash_password(const std::string& password) const {
    unsigned char salt_bytes[kSaltLength];
    if (RAND_bytes(salt_bytes, static_cast<int>(kSaltLength)) != 1) {
        LOG_ERROR("RAND_bytes failed while generating a salt");
        return "";
    }
    std::string salt = to_hex(salt_bytes, kSaltLength);

    auto key = derive_key(password, salt, iterations_);
    if (!key) {
        return "";
    }

    // Format: $pbkdf2-sha256$iterations$salt$hash
    return std::string(kHashScheme) + std::to_string(iterations_) + "$" + salt + "$" + *key;
}

bool AccountRegistry::verify_password(const std::string& password, const std::string& hash) {
    if (hash.compare(0, kHashScheme.size(), kHashScheme) != 0) {
        return false;
    }

    size_t pos1 = kHashScheme.size();
    size_t pos2 = hash.find('$', pos1);
    if (pos2 == std::string::npos) return false;

    int iterations = 0;
    auto [ptr, ec] = std::from_chars(hash.data() + pos1, hash.data() + pos2, iterations);
    if (ec != std::errc() || ptr != hash.data() + pos2 || iterations <= 0) {
        return false;
    }

    size_t pos3 = hash.find('$', pos2 + 1);
    if (pos3 == std::string::npos) return false;

    std::string salt = hash.substr(pos2 + 1, pos3 - pos2 - 1);
    std::string stored_key = hash.substr(pos3 + 1);

    auto key = derive_key(password, salt, iterations);
    if (!key || key->size() != stored_key.size()) {
        return false;
    }
    return CRYPTO_memcmp(key->data(), stored_key.data(), key->size()) == 0;
}

}  // namespace mailhub
