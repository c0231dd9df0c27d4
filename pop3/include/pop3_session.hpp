#pragma once

#include "net/connection.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "pop3_commands.hpp"
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mailhub::pop3 {

struct Authorization {
    std::optional<std::string> candidate;
    size_t failures = 0;
};

// Message numbers are 1-based positions in the snapshot taken at login.
struct Transaction {
    std::string user;
    std::vector<Message> snapshot;
    std::set<size_t> deleted;
};

struct Update {};

using SessionState = std::variant<Authorization, Transaction, Update>;

class POP3Session : public LineSession {
public:
    POP3Session(MailStore& store, const POP3Config& config);
    ~POP3Session() override = default;

    void on_connect(const std::string& peer) override;
    std::string greeting() override;
    std::string on_line(const std::string& line) override;
    bool finished() const override { return finished_; }
    // Idle expiry commits pending deletions like QUIT.
    void on_timeout() override;
    void on_disconnect() override;

    const SessionState& state() const { return state_; }
    void set_state(SessionState state) { state_ = std::move(state); }

    Authorization* authorization() { return std::get_if<Authorization>(&state_); }
    Transaction* transaction() { return std::get_if<Transaction>(&state_); }
    const Transaction* transaction() const { return std::get_if<Transaction>(&state_); }

    // Checks the candidate's secret; on success logs in and snapshots the inbox.
    std::string login(const std::string& secret);

    // nullptr when the number is out of range or marked deleted.
    const Message* message(size_t number) const;
    bool is_deleted(size_t number) const;
    size_t message_count() const;
    size_t total_size() const;

    // Sets the read flag in the store and in the snapshot.
    void mark_read(size_t number);

    // Enters Update: moves every marked message to trash and logs out.
    // Returns the number of deletions that could not be committed.
    size_t commit_and_logout();

    MailStore& store() { return store_; }
    const POP3Config& config() const { return config_; }
    const std::string& hostname() const { return config_.hostname; }

    void finish() { finished_ = true; }

private:
    std::string process_command(const std::string& line);

    MailStore& store_;
    POP3Config config_;
    SessionState state_;
    std::string peer_ = "unknown";
    bool finished_ = false;
};

}  // namespace mailhub::pop3
