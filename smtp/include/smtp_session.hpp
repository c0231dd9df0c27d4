#pragma once

#include "net/connection.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "smtp_commands.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mailhub::smtp {

struct Greeting {};

struct Identified {
    std::string client;
};

struct SenderSet {
    std::string client;
    std::string sender;
};

struct RecipientSet {
    std::string client;
    std::string sender;
    std::vector<std::string> recipients;
};

struct DataPhase {
    std::string client;
    std::string sender;
    std::vector<std::string> recipients;
    std::string payload;
    bool overflow = false;
};

using SessionState = std::variant<Greeting, Identified, SenderSet, RecipientSet, DataPhase>;

// Progress of a multi-line AUTH exchange.
enum class AuthStep {
    NONE,
    PLAIN_WAITING,
    LOGIN_WAITING_USERNAME,
    LOGIN_WAITING_PASSWORD
};

class SMTPSession : public LineSession {
public:
    SMTPSession(MailStore& store, const SMTPConfig& config);
    ~SMTPSession() override = default;

    void on_connect(const std::string& peer) override;
    std::string greeting() override;
    std::string on_line(const std::string& line) override;
    bool finished() const override { return finished_; }
    void on_disconnect() override;

    const SessionState& state() const { return state_; }
    void set_state(SessionState state) { state_ = std::move(state); }

    // Client name given with HELO/EHLO; empty before identification.
    std::string client_hostname() const;

    AuthStep auth_step() const { return auth_step_; }
    void set_auth_step(AuthStep step) { auth_step_ = step; }

    bool is_authenticated() const { return authenticated_user_.has_value(); }
    const std::optional<std::string>& authenticated_user() const { return authenticated_user_; }
    size_t auth_failures() const { return auth_failures_; }

    // Checks credentials and produces the 235/535 reply, or 421 once the
    // failure limit is reached.
    std::string complete_auth(const std::string& username, const std::string& password);

    // Decodes an AUTH PLAIN response and checks it.
    std::string complete_plain(const std::string& encoded);

    MailStore& store() { return store_; }
    const SMTPConfig& config() const { return config_; }
    const std::string& hostname() const { return config_.hostname; }
    const std::string& peer() const { return peer_; }

    void finish() { finished_ = true; }

private:
    std::string process_command(const std::string& line);
    std::string process_data_line(DataPhase& data, const std::string& line);
    std::string process_auth_response(const std::string& line);
    std::string deliver(DataPhase data);

    MailStore& store_;
    SMTPConfig config_;
    SessionState state_;
    AuthStep auth_step_ = AuthStep::NONE;
    std::string auth_username_;
    std::optional<std::string> authenticated_user_;
    size_t auth_failures_ = 0;
    std::string peer_ = "unknown";
    bool finished_ = false;
};

}  // namespace mailhub::smtp
