#include "pop3_commands.hpp"
#include "pop3_session.hpp"
#include "codec.hpp"
#include "strings.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace mailhub::pop3 {

Command Command::parse(const std::string& line) {
    Command cmd;

    if (line.empty()) {
        return cmd;
    }

    std::istringstream iss(line);
    std::string name;
    iss >> name;

    name = strings::upper(name);
    cmd.name = name;
    cmd.type = string_to_type(name);

    std::getline(iss >> std::ws, cmd.argument);

    std::istringstream arg_stream(cmd.argument);
    std::string arg;
    while (arg_stream >> arg) {
        cmd.args.push_back(arg);
    }

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"USER", CommandType::USER},
        {"PASS", CommandType::PASS},
        {"STAT", CommandType::STAT},
        {"LIST", CommandType::LIST},
        {"RETR", CommandType::RETR},
        {"DELE", CommandType::DELE},
        {"NOOP", CommandType::NOOP},
        {"RSET", CommandType::RSET},
        {"QUIT", CommandType::QUIT},
        {"TOP", CommandType::TOP},
        {"UIDL", CommandType::UIDL},
        {"CAPA", CommandType::CAPA}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::USER: return "USER";
        case CommandType::PASS: return "PASS";
        case CommandType::STAT: return "STAT";
        case CommandType::LIST: return "LIST";
        case CommandType::RETR: return "RETR";
        case CommandType::DELE: return "DELE";
        case CommandType::NOOP: return "NOOP";
        case CommandType::RSET: return "RSET";
        case CommandType::QUIT: return "QUIT";
        case CommandType::TOP: return "TOP";
        case CommandType::UIDL: return "UIDL";
        case CommandType::CAPA: return "CAPA";
        default: return "UNKNOWN";
    }
}

std::optional<size_t> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

namespace {

// Resolves a message-number argument to a live message.
const Message* resolve(POP3Session& session, const std::string& arg, std::string& error) {
    auto number = parse_number(arg);
    if (!number) {
        error = response::err("Invalid message number");
        return nullptr;
    }
    if (session.is_deleted(*number)) {
        error = response::err("Message " + arg + " already deleted");
        return nullptr;
    }
    const Message* msg = session.message(*number);
    if (!msg) {
        error = response::err("No such message");
    }
    return msg;
}

}  // namespace

CommandHandler& CommandHandler::instance() {
    static CommandHandler instance;
    return instance;
}

CommandHandler::CommandHandler() {
    handlers_[CommandType::USER] = handle_user;
    handlers_[CommandType::PASS] = handle_pass;
    handlers_[CommandType::STAT] = handle_stat;
    handlers_[CommandType::LIST] = handle_list;
    handlers_[CommandType::RETR] = handle_retr;
    handlers_[CommandType::DELE] = handle_dele;
    handlers_[CommandType::NOOP] = handle_noop;
    handlers_[CommandType::RSET] = handle_rset;
    handlers_[CommandType::QUIT] = handle_quit;
    handlers_[CommandType::TOP] = handle_top;
    handlers_[CommandType::UIDL] = handle_uidl;
    handlers_[CommandType::CAPA] = handle_capa;
}

std::string CommandHandler::execute(POP3Session& session, const Command& cmd) {
    auto it = handlers_.find(cmd.type);
    if (it != handlers_.end()) {
        return it->second(session, cmd);
    }
    return response::err("Unknown command");
}

std::string CommandHandler::handle_user(POP3Session& session, const Command& cmd) {
    auto* auth = session.authorization();
    if (!auth) {
        return response::err("Already authenticated");
    }

    if (cmd.argument.empty()) {
        return response::err("Username required");
    }

    auto info = session.store().lookup_user(cmd.argument);
    if (!info) {
        auth->candidate.reset();
        return response::err("No such user");
    }

    auth->candidate = info->username;
    return response::ok(info->username + " is a valid mailbox");
}

std::string CommandHandler::handle_pass(POP3Session& session, const Command& cmd) {
    if (!session.authorization()) {
        return response::err("Already authenticated");
    }

    return session.login(cmd.argument);
}

std::string CommandHandler::handle_stat(POP3Session& session, const Command& /* cmd */) {
    return response::ok(std::to_string(session.message_count()) + " " +
                        std::to_string(session.total_size()));
}

std::string CommandHandler::handle_list(POP3Session& session, const Command& cmd) {
    if (!cmd.args.empty()) {
        std::string error;
        const Message* msg = resolve(session, cmd.args[0], error);
        if (!msg) {
            return error;
        }
        return response::ok(cmd.args[0] + " " + std::to_string(msg->size()));
    }

    std::ostringstream oss;
    const auto* txn = session.transaction();
    for (size_t number = 1; txn && number <= txn->snapshot.size(); ++number) {
        if (const Message* msg = session.message(number)) {
            oss << number << " " << msg->size() << "\r\n";
        }
    }

    return response::multi(
        response::ok(std::to_string(session.message_count()) + " messages (" +
                     std::to_string(session.total_size()) + " octets)"),
        oss.str());
}

std::string CommandHandler::handle_retr(POP3Session& session, const Command& cmd) {
    if (cmd.args.empty()) {
        return response::err("Message number required");
    }

    std::string error;
    const Message* msg = resolve(session, cmd.args[0], error);
    if (!msg) {
        return error;
    }

    std::string rendering = msg->render();
    session.mark_read(*parse_number(cmd.args[0]));

    return response::multi(response::ok(std::to_string(rendering.size()) + " octets"),
                           codec::stuff_text(rendering));
}

std::string CommandHandler::handle_dele(POP3Session& session, const Command& cmd) {
    if (cmd.args.empty()) {
        return response::err("Message number required");
    }

    std::string error;
    if (!resolve(session, cmd.args[0], error)) {
        return error;
    }

    session.transaction()->deleted.insert(*parse_number(cmd.args[0]));
    return response::ok("Message " + cmd.args[0] + " deleted");
}

std::string CommandHandler::handle_noop(POP3Session& /* session */, const Command& /* cmd */) {
    return response::ok();
}

std::string CommandHandler::handle_rset(POP3Session& session, const Command& /* cmd */) {
    session.transaction()->deleted.clear();
    return response::ok("maildrop has " + std::to_string(session.message_count()) + " messages (" +
                        std::to_string(session.total_size()) + " octets)");
}

std::string CommandHandler::handle_quit(POP3Session& session, const Command& /* cmd */) {
    session.finish();

    if (!session.transaction()) {
        return response::ok(session.hostname() + " POP3 server signing off");
    }

    size_t pending = session.transaction()->deleted.size();
    size_t failures = session.commit_and_logout();
    if (failures > 0) {
        return response::err("Some deleted messages not removed (" + std::to_string(failures) +
                             " of " + std::to_string(pending) + ")");
    }

    return response::ok(session.hostname() + " POP3 server signing off (" +
                        std::to_string(pending) + " messages deleted)");
}

std::string CommandHandler::handle_top(POP3Session& session, const Command& cmd) {
    if (cmd.args.size() < 2) {
        return response::err("Usage: TOP msg lines");
    }

    std::string error;
    const Message* msg = resolve(session, cmd.args[0], error);
    if (!msg) {
        return error;
    }

    auto lines = parse_number(cmd.args[1]);
    if (!lines) {
        return response::err("Invalid line count");
    }

    std::string text = msg->header_block() + "\r\n";

    std::string body = codec::to_crlf(msg->body);
    size_t pos = 0;
    for (size_t count = 0; count < *lines && pos < body.size(); ++count) {
        size_t eol = body.find("\r\n", pos);
        if (eol == std::string::npos) {
            text += body.substr(pos);
            break;
        }
        text += body.substr(pos, eol - pos + 2);
        pos = eol + 2;
    }

    return response::multi(response::ok("Top of message follows"), codec::stuff_text(text));
}

std::string CommandHandler::handle_uidl(POP3Session& session, const Command& cmd) {
    if (!cmd.args.empty()) {
        std::string error;
        const Message* msg = resolve(session, cmd.args[0], error);
        if (!msg) {
            return error;
        }
        return response::ok(cmd.args[0] + " " + msg->id);
    }

    std::ostringstream oss;
    const auto* txn = session.transaction();
    for (size_t number = 1; txn && number <= txn->snapshot.size(); ++number) {
        if (const Message* msg = session.message(number)) {
            oss << number << " " << msg->id << "\r\n";
        }
    }

    return response::multi(response::ok(), oss.str());
}

std::string CommandHandler::handle_capa(POP3Session& /* session */, const Command& /* cmd */) {
    return response::multi(response::ok("Capability list follows"),
                           "USER\r\n"
                           "TOP\r\n"
                           "UIDL\r\n"
                           "PIPELINING\r\n"
                           "RESP-CODES\r\n"
                           "IMPLEMENTATION mailhub\r\n");
}

}  // namespace mailhub::pop3
