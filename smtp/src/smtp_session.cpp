#include "smtp_session.hpp"
#include "codec.hpp"
#include "logger.hpp"
#include <type_traits>

namespace mailhub::smtp {

SMTPSession::SMTPSession(MailStore& store, const SMTPConfig& config)
    : store_(store)
    , config_(config) {
}

void SMTPSession::on_connect(const std::string& peer) {
    peer_ = peer;
    LOG_INFO_FMT("SMTP session started for {}", peer_);
}

std::string SMTPSession::greeting() {
    return reply::make(reply::SERVICE_READY, config_.hostname + " ESMTP mailhub ready");
}

void SMTPSession::on_disconnect() {
    if (std::holds_alternative<DataPhase>(state_)) {
        LOG_INFO_FMT("SMTP client {} disconnected during DATA, message discarded", peer_);
    }
    LOG_INFO_FMT("SMTP session ended for {}", peer_);
}

std::string SMTPSession::client_hostname() const {
    return std::visit([](const auto& s) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(s)>, Greeting>) {
            return "";
        } else {
            return s.client;
        }
    }, state_);
}

std::string SMTPSession::on_line(const std::string& line) {
    if (finished_) {
        return "";
    }
    if (auto* data = std::get_if<DataPhase>(&state_)) {
        return process_data_line(*data, line);
    }
    if (auth_step_ != AuthStep::NONE) {
        return process_auth_response(line);
    }
    return process_command(line);
}

std::string SMTPSession::process_command(const std::string& line) {
    Command cmd = Command::parse(line);

    if (cmd.type == CommandType::AUTH) {
        LOG_DEBUG_FMT("SMTP {} command: AUTH", peer_);
    } else {
        LOG_DEBUG_FMT("SMTP {} command: {}", peer_, line);
    }

    if (cmd.type == CommandType::UNKNOWN) {
        return reply::make(reply::SYNTAX_ERROR, "Syntax error, command unrecognized");
    }

    return CommandHandler::instance().execute(*this, cmd);
}

std::string SMTPSession::process_data_line(DataPhase& data, const std::string& line) {
    if (line == ".") {
        return deliver(std::move(data));
    }

    if (data.overflow) {
        return "";
    }

    std::string content = codec::unstuff_line(line);
    if (data.payload.size() + content.size() + 2 > config_.max_message_size) {
        data.overflow = true;
        data.payload.clear();
        data.payload.shrink_to_fit();
        return "";
    }

    data.payload += content;
    data.payload += "\r\n";
    return "";
}

std::string SMTPSession::deliver(DataPhase data) {
    Identified next{data.client};

    if (data.overflow) {
        LOG_INFO_FMT("SMTP {} message from {} exceeds {} bytes", peer_, data.sender,
                     config_.max_message_size);
        state_ = next;
        return reply::make(reply::EXCEEDED_STORAGE, "Message size exceeds fixed maximum message size");
    }

    Message msg = Message::from_payload(data.payload, data.sender, data.recipients);
    msg.id = store_.allocate_id();

    DeliveryReport report = store_.deliver_all(msg);

    if (authenticated_user_ && !store_.file_message(*authenticated_user_, Folder::Sent, msg)) {
        LOG_WARNING_FMT("Could not file {} in sent folder of {}", msg.id, *authenticated_user_);
    }

    // The transaction is over whatever the outcome.
    state_ = next;

    if (report.all_delivered()) {
        LOG_INFO_FMT("SMTP {} accepted {} from {} for {} recipient(s)", peer_, msg.id,
                     data.sender, report.results.size());
        return reply::make(reply::OK, "OK message accepted as " + msg.id);
    }

    std::string failed;
    for (const auto& result : report.failed()) {
        if (!failed.empty()) failed += ", ";
        failed += result.recipient + " (" + status_name(result.status) + ")";
    }
    LOG_INFO_FMT("SMTP {} delivery of {} failed for: {}", peer_, msg.id, failed);

    if (report.any_unknown()) {
        return reply::make(reply::MAILBOX_NOT_FOUND, "Delivery failed for: " + failed);
    }
    return reply::make(reply::LOCAL_ERROR, "Local error in processing, delivery failed for: " + failed);
}

std::string SMTPSession::process_auth_response(const std::string& line) {
    AuthStep step = auth_step_;

    if (line == "*") {
        auth_step_ = AuthStep::NONE;
        auth_username_.clear();
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Authentication cancelled");
    }

    switch (step) {
        case AuthStep::PLAIN_WAITING:
            auth_step_ = AuthStep::NONE;
            return complete_plain(line);

        case AuthStep::LOGIN_WAITING_USERNAME:
            auth_username_ = codec::base64_decode(line);
            auth_step_ = AuthStep::LOGIN_WAITING_PASSWORD;
            return reply::make(reply::AUTH_CONTINUE, codec::base64_encode("Password:"));

        case AuthStep::LOGIN_WAITING_PASSWORD: {
            auth_step_ = AuthStep::NONE;
            std::string username = std::move(auth_username_);
            auth_username_.clear();
            return complete_auth(username, codec::base64_decode(line));
        }

        case AuthStep::NONE:
            break;
    }

    return process_command(line);
}

std::string SMTPSession::complete_plain(const std::string& encoded) {
    // authzid NUL authcid NUL password
    std::string decoded = codec::base64_decode(encoded);
    size_t first_null = decoded.find('\0');
    size_t second_null = first_null == std::string::npos
        ? std::string::npos
        : decoded.find('\0', first_null + 1);

    if (second_null == std::string::npos) {
        return complete_auth("", "");
    }

    return complete_auth(decoded.substr(first_null + 1, second_null - first_null - 1),
                         decoded.substr(second_null + 1));
}

std::string SMTPSession::complete_auth(const std::string& username, const std::string& password) {
    if (!username.empty() && store_.authenticate(username, password)) {
        auto info = store_.lookup_user(username);
        authenticated_user_ = info ? info->username : username;
        LOG_INFO_FMT("SMTP {} authenticated as {}", peer_, *authenticated_user_);
        return reply::make(reply::AUTH_SUCCESS, "Authentication successful");
    }

    ++auth_failures_;
    LOG_INFO_FMT("SMTP {} authentication failed for '{}' ({}/{})", peer_, username,
                 auth_failures_, config_.max_auth_attempts);

    if (auth_failures_ >= config_.max_auth_attempts) {
        finished_ = true;
        return reply::make(reply::SERVICE_NOT_AVAILABLE,
                           config_.hostname + " Too many authentication failures, closing connection");
    }
    return reply::make(reply::AUTH_INVALID, "Authentication credentials invalid");
}

}  // namespace mailhub::smtp
