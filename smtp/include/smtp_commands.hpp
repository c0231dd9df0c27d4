#pragma once

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <optional>

namespace mailhub::smtp {

class SMTPSession;

enum class CommandType {
    HELO,
    EHLO,
    MAIL,      // MAIL FROM:
    RCPT,      // RCPT TO:
    DATA,
    RSET,
    NOOP,
    QUIT,
    VRFY,
    AUTH,
    HELP,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;
    std::string argument;

    static Command parse(const std::string& line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

class CommandHandler {
public:
    using Handler = std::function<std::string(SMTPSession&, const Command&)>;

    static CommandHandler& instance();

    std::string execute(SMTPSession& session, const Command& cmd);

    static std::string handle_helo(SMTPSession& session, const Command& cmd);
    static std::string handle_ehlo(SMTPSession& session, const Command& cmd);
    static std::string handle_mail(SMTPSession& session, const Command& cmd);
    static std::string handle_rcpt(SMTPSession& session, const Command& cmd);
    static std::string handle_data(SMTPSession& session, const Command& cmd);
    static std::string handle_rset(SMTPSession& session, const Command& cmd);
    static std::string handle_noop(SMTPSession& session, const Command& cmd);
    static std::string handle_quit(SMTPSession& session, const Command& cmd);
    static std::string handle_vrfy(SMTPSession& session, const Command& cmd);
    static std::string handle_auth(SMTPSession& session, const Command& cmd);
    static std::string handle_help(SMTPSession& session, const Command& cmd);

private:
    CommandHandler();
    std::unordered_map<CommandType, Handler> handlers_;
};

// SMTP reply codes
namespace reply {
    constexpr int HELP = 214;
    constexpr int SERVICE_READY = 220;
    constexpr int SERVICE_CLOSING = 221;
    constexpr int AUTH_SUCCESS = 235;
    constexpr int OK = 250;
    constexpr int CANNOT_VRFY = 252;

    constexpr int AUTH_CONTINUE = 334;
    constexpr int START_MAIL_INPUT = 354;

    constexpr int SERVICE_NOT_AVAILABLE = 421;
    constexpr int LOCAL_ERROR = 451;
    constexpr int TOO_MANY_RECIPIENTS = 452;

    constexpr int SYNTAX_ERROR = 500;
    constexpr int SYNTAX_ERROR_PARAMS = 501;
    constexpr int BAD_SEQUENCE = 503;
    constexpr int PARAM_NOT_IMPLEMENTED = 504;
    constexpr int AUTH_REQUIRED = 530;
    constexpr int AUTH_INVALID = 535;
    constexpr int MAILBOX_NOT_FOUND = 550;
    constexpr int EXCEEDED_STORAGE = 552;
    constexpr int MAILBOX_NAME_INVALID = 553;

    inline std::string make(int code, const std::string& message) {
        return std::to_string(code) + " " + message;
    }

    inline std::string make_multi(int code, const std::vector<std::string>& lines) {
        std::string result;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i == lines.size() - 1) {
                result += std::to_string(code) + " " + lines[i];
            } else {
                result += std::to_string(code) + "-" + lines[i] + "\r\n";
            }
        }
        return result;
    }
}

// A mailbox argument of MAIL, RCPT or VRFY. The address is taken from
// between angle brackets when present, otherwise the whole trimmed text.
// A bare local name without '@' is accepted.
struct Address {
    std::string full_address;

    static std::optional<Address> parse(const std::string& str);
};

}  // namespace mailhub::smtp
