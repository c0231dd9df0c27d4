#include "auth/account_registry.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>

void print_usage(const char* program) {
    std::cout << "mailhub Account Management Tool\n\n"
              << "Usage: " << program << " [options] <command> [arguments]\n\n"
              << "Commands:\n"
              << "  add <username> <address>    Add a new account\n"
              << "  passwd <user>               Change an account's password\n"
              << "  list                        List accounts\n"
              << "  info <user>                 Show an account and its folders\n\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file (default: /etc/mailhub/mailhub.conf)\n"
              << "  -d, --database <file>  Account database (overrides config)\n"
              << "  -r, --root <path>      Mail storage root (overrides config)\n"
              << "  -h, --help             Show this help\n";
}

std::string read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    termios old_term{};
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        termios new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string password;
    std::getline(std::cin, password);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cout << "\n";

    return password;
}

bool read_new_password(std::string& password) {
    password = read_password("Enter password: ");
    std::string password_confirm = read_password("Confirm password: ");

    if (password != password_confirm) {
        std::cerr << "Passwords do not match.\n";
        return false;
    }
    if (password.empty()) {
        std::cerr << "Password cannot be empty.\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file = "/etc/mailhub/mailhub.conf";
    std::string db_file;
    std::string mail_root;

    int cmd_start = argc;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            db_file = argv[++i];
        } else if ((arg == "-r" || arg == "--root") && i + 1 < argc) {
            mail_root = argv[++i];
        } else if (arg[0] != '-') {
            cmd_start = i;
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (cmd_start >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    // Store diagnostics go to stderr; only warnings and worse.
    mailhub::Logger::instance().init(mailhub::LogLevel::Warning, true);

    mailhub::Config config;
    config.load(config_file);

    if (db_file.empty()) {
        db_file = config.storage().accounts_db.string();
    }
    if (mail_root.empty()) {
        mail_root = config.storage().root.string();
    }

    mailhub::AccountRegistry registry(db_file);
    if (!registry.initialize()) {
        std::cerr << "Failed to initialize database: " << registry.last_error() << "\n";
        return 1;
    }

    mailhub::MailStore store(registry, mail_root);
    if (!store.open()) {
        std::cerr << "Failed to open mail store at " << mail_root << "\n";
        return 1;
    }

    std::string command = argv[cmd_start];

    if (command == "add") {
        if (cmd_start + 2 >= argc) {
            std::cerr << "Usage: add <username> <address>\n";
            return 1;
        }

        std::string username = argv[cmd_start + 1];
        std::string address = argv[cmd_start + 2];

        std::string password;
        if (!read_new_password(password)) {
            return 1;
        }

        if (!store.create_user(username, address, password)) {
            std::cerr << "Failed to create account: " << username << "\n";
            return 1;
        }

        std::cout << "Account created: " << username << " <" << address << ">\n";
        std::cout << "Mail directory: " << (store.root() / username).string() << "\n";

    } else if (command == "passwd") {
        if (cmd_start + 1 >= argc) {
            std::cerr << "Usage: passwd <user>\n";
            return 1;
        }

        std::string user = argv[cmd_start + 1];
        if (!registry.get_account(user)) {
            std::cerr << "Account not found: " << user << "\n";
            return 1;
        }

        std::string password;
        if (!read_new_password(password)) {
            return 1;
        }

        if (!registry.change_password(user, password)) {
            std::cerr << "Failed to change password: " << registry.last_error() << "\n";
            return 1;
        }

        std::cout << "Password changed for: " << user << "\n";

    } else if (command == "list") {
        auto users = store.list_users();

        if (users.empty()) {
            std::cout << "No accounts found.\n";
        } else {
            std::cout << "Accounts:\n";
            for (const auto& user : users) {
                std::cout << "  " << user.username << " <" << user.address << ">\n";
            }
        }

    } else if (command == "info") {
        if (cmd_start + 1 >= argc) {
            std::cerr << "Usage: info <user>\n";
            return 1;
        }

        std::string user = argv[cmd_start + 1];
        auto account = registry.get_account(user);
        if (!account) {
            std::cerr << "Account not found: " << user << "\n";
            return 1;
        }

        std::cout << "User: " << account->username << "\n";
        std::cout << "Address: " << account->address << "\n";
        std::cout << "Created: " << account->created_at << "\n";
        std::cout << "Mail directory: " << (store.root() / account->username).string() << "\n";

        for (auto folder : mailhub::kAllFolders) {
            auto messages = store.snapshot(account->username, folder);
            size_t total = 0;
            size_t unread = 0;
            for (const auto& msg : messages) {
                total += msg.size();
                if (!msg.read) ++unread;
            }
            std::cout << "  " << mailhub::folder_name(folder) << ": " << messages.size()
                      << " messages (" << unread << " unread), " << total << " bytes\n";
        }

    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    return 0;
}
