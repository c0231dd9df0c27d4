#include "smtp_commands.hpp"
#include "smtp_session.hpp"
#include "codec.hpp"
#include "strings.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace mailhub::smtp {

namespace {

using strings::trim;
using strings::upper;

// Strips a case-insensitive "FROM:" / "TO:" prefix; nullopt when absent.
std::optional<std::string> strip_keyword(const std::string& argument, const std::string& keyword) {
    if (argument.size() < keyword.size() ||
        upper(argument.substr(0, keyword.size())) != keyword) {
        return std::nullopt;
    }
    return trim(argument.substr(keyword.size()));
}

}  // namespace

Command Command::parse(const std::string& line) {
    Command cmd;

    std::string text = trim(line);
    if (text.empty()) {
        return cmd;
    }

    size_t sep = text.find(' ');
    cmd.name = upper(text.substr(0, sep));
    cmd.type = string_to_type(cmd.name);

    if (sep != std::string::npos) {
        cmd.argument = trim(text.substr(sep + 1));
    }

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"HELO", CommandType::HELO},
        {"EHLO", CommandType::EHLO},
        {"MAIL", CommandType::MAIL},
        {"RCPT", CommandType::RCPT},
        {"DATA", CommandType::DATA},
        {"RSET", CommandType::RSET},
        {"NOOP", CommandType::NOOP},
        {"QUIT", CommandType::QUIT},
        {"VRFY", CommandType::VRFY},
        {"AUTH", CommandType::AUTH},
        {"HELP", CommandType::HELP}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::HELO: return "HELO";
        case CommandType::EHLO: return "EHLO";
        case CommandType::MAIL: return "MAIL";
        case CommandType::RCPT: return "RCPT";
        case CommandType::DATA: return "DATA";
        case CommandType::RSET: return "RSET";
        case CommandType::NOOP: return "NOOP";
        case CommandType::QUIT: return "QUIT";
        case CommandType::VRFY: return "VRFY";
        case CommandType::AUTH: return "AUTH";
        case CommandType::HELP: return "HELP";
        default: return "UNKNOWN";
    }
}

std::optional<Address> Address::parse(const std::string& str) {
    std::string email = trim(str);

    auto open = email.find('<');
    if (open != std::string::npos) {
        auto close = email.find('>', open + 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        email = trim(email.substr(open + 1, close - open - 1));
    }

    if (email.empty()) {
        return std::nullopt;
    }

    bool bad_char = std::any_of(email.begin(), email.end(), [](unsigned char c) {
        return std::isspace(c) || c == '<' || c == '>' || c < 32 || c == 127;
    });
    if (bad_char) {
        return std::nullopt;
    }

    auto at = email.find('@');
    if (at != std::string::npos &&
        (at == 0 || at == email.length() - 1 || email.find('@', at + 1) != std::string::npos)) {
        return std::nullopt;
    }

    Address addr;
    addr.full_address = email;
    return addr;
}

CommandHandler& CommandHandler::instance() {
    static CommandHandler instance;
    return instance;
}

CommandHandler::CommandHandler() {
    handlers_[CommandType::HELO] = handle_helo;
    handlers_[CommandType::EHLO] = handle_ehlo;
    handlers_[CommandType::MAIL] = handle_mail;
    handlers_[CommandType::RCPT] = handle_rcpt;
    handlers_[CommandType::DATA] = handle_data;
    handlers_[CommandType::RSET] = handle_rset;
    handlers_[CommandType::NOOP] = handle_noop;
    handlers_[CommandType::QUIT] = handle_quit;
    handlers_[CommandType::VRFY] = handle_vrfy;
    handlers_[CommandType::AUTH] = handle_auth;
    handlers_[CommandType::HELP] = handle_help;
}

std::string CommandHandler::execute(SMTPSession& session, const Command& cmd) {
    auto it = handlers_.find(cmd.type);
    if (it != handlers_.end()) {
        return it->second(session, cmd);
    }
    return reply::make(reply::SYNTAX_ERROR, "Syntax error, command unrecognized");
}

std::string CommandHandler::handle_helo(SMTPSession& session, const Command& cmd) {
    session.set_state(Identified{cmd.argument});

    std::string greeting = session.hostname();
    if (!cmd.argument.empty()) {
        greeting += " Hello " + cmd.argument;
    }
    return reply::make(reply::OK, greeting);
}

std::string CommandHandler::handle_ehlo(SMTPSession& session, const Command& cmd) {
    session.set_state(Identified{cmd.argument});

    std::vector<std::string> capabilities;
    capabilities.push_back(cmd.argument.empty()
        ? session.hostname()
        : session.hostname() + " Hello " + cmd.argument);
    capabilities.push_back("SIZE " + std::to_string(session.config().max_message_size));
    capabilities.push_back("PIPELINING");
    capabilities.push_back("AUTH PLAIN LOGIN");
    capabilities.push_back("HELP");

    return reply::make_multi(reply::OK, capabilities);
}

std::string CommandHandler::handle_mail(SMTPSession& session, const Command& cmd) {
    const auto* identified = std::get_if<Identified>(&session.state());
    if (!identified) {
        if (std::holds_alternative<Greeting>(session.state())) {
            return reply::make(reply::BAD_SEQUENCE, "Send HELO/EHLO first");
        }
        return reply::make(reply::BAD_SEQUENCE, "Sender already specified");
    }

    if (session.config().require_auth && !session.is_authenticated()) {
        return reply::make(reply::AUTH_REQUIRED, "Authentication required");
    }

    auto argument = strip_keyword(cmd.argument, "FROM:");
    if (!argument) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: MAIL FROM:<address>");
    }

    auto addr = Address::parse(*argument);
    if (!addr) {
        return reply::make(reply::MAILBOX_NAME_INVALID, "Invalid sender address");
    }

    session.set_state(SenderSet{identified->client, addr->full_address});
    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_rcpt(SMTPSession& session, const Command& cmd) {
    const auto& state = session.state();
    if (!std::holds_alternative<SenderSet>(state) && !std::holds_alternative<RecipientSet>(state)) {
        return reply::make(reply::BAD_SEQUENCE, "Send MAIL FROM first");
    }

    if (session.config().require_auth && !session.is_authenticated()) {
        return reply::make(reply::AUTH_REQUIRED, "Authentication required");
    }

    auto argument = strip_keyword(cmd.argument, "TO:");
    if (!argument) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: RCPT TO:<address>");
    }

    auto addr = Address::parse(*argument);
    if (!addr) {
        return reply::make(reply::MAILBOX_NAME_INVALID, "Invalid recipient address");
    }

    RecipientSet next;
    if (const auto* sender_set = std::get_if<SenderSet>(&state)) {
        next = RecipientSet{sender_set->client, sender_set->sender, {}};
    } else {
        next = std::get<RecipientSet>(state);
    }

    if (next.recipients.size() >= session.config().max_recipients) {
        return reply::make(reply::TOO_MANY_RECIPIENTS, "Too many recipients");
    }

    next.recipients.push_back(addr->full_address);
    session.set_state(std::move(next));
    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_data(SMTPSession& session, const Command& /* cmd */) {
    const auto* recipients = std::get_if<RecipientSet>(&session.state());
    if (!recipients) {
        return reply::make(reply::BAD_SEQUENCE, "Send RCPT TO first");
    }

    DataPhase data{recipients->client, recipients->sender, recipients->recipients, "", false};
    session.set_state(std::move(data));
    return reply::make(reply::START_MAIL_INPUT, "Start mail input; end with <CRLF>.<CRLF>");
}

std::string CommandHandler::handle_rset(SMTPSession& session, const Command& /* cmd */) {
    session.set_state(Identified{session.client_hostname()});
    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_noop(SMTPSession& /* session */, const Command& /* cmd */) {
    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_quit(SMTPSession& session, const Command& /* cmd */) {
    session.finish();
    return reply::make(reply::SERVICE_CLOSING, session.hostname() + " closing connection");
}

std::string CommandHandler::handle_vrfy(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Address required");
    }

    auto addr = Address::parse(cmd.argument);
    if (!addr) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Invalid address");
    }

    if (auto user = session.store().lookup_user(addr->full_address)) {
        return reply::make(reply::OK, user->username + " <" + user->address + ">");
    }

    return reply::make(reply::CANNOT_VRFY, "Cannot verify user");
}

std::string CommandHandler::handle_auth(SMTPSession& session, const Command& cmd) {
    if (!session.config().require_auth) {
        return reply::make(reply::AUTH_SUCCESS, "Authentication not required");
    }

    if (std::holds_alternative<Greeting>(session.state())) {
        return reply::make(reply::BAD_SEQUENCE, "Send HELO/EHLO first");
    }

    if (session.is_authenticated()) {
        return reply::make(reply::BAD_SEQUENCE, "Already authenticated");
    }

    std::istringstream iss(cmd.argument);
    std::string mechanism;
    std::string initial_response;
    iss >> mechanism >> initial_response;
    mechanism = upper(mechanism);

    if (mechanism == "PLAIN") {
        if (initial_response.empty()) {
            session.set_auth_step(AuthStep::PLAIN_WAITING);
            return reply::make(reply::AUTH_CONTINUE, "");
        }

        return session.complete_plain(initial_response);
    } else if (mechanism == "LOGIN") {
        session.set_auth_step(AuthStep::LOGIN_WAITING_USERNAME);
        return reply::make(reply::AUTH_CONTINUE, codec::base64_encode("Username:"));
    }

    return reply::make(reply::PARAM_NOT_IMPLEMENTED, "Unrecognized authentication mechanism");
}

std::string CommandHandler::handle_help(SMTPSession& session, const Command& /* cmd */) {
    std::vector<std::string> help;
    help.push_back(session.hostname() + " supports:");
    help.push_back("HELO EHLO AUTH MAIL RCPT DATA RSET NOOP QUIT VRFY HELP");

    return reply::make_multi(reply::HELP, help);
}

}  // namespace mailhub::smtp
