#include "smtp_server.hpp"
#include "pop3_server.hpp"
#include "auth/account_registry.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int /* signal */) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/mailhub/mailhub.conf";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "mailhubd v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    mailhub::Config config;
    bool config_loaded = config.load(config_file);

    const auto& log = config.log();
    mailhub::Logger::instance().init(
        static_cast<mailhub::LogLevel>(log.level),
        log.log_to_console,
        log.log_to_file ? log.file : std::filesystem::path{},
        log.max_file_size,
        log.max_files
    );

    LOG_INFO("mailhubd starting...");
    if (!config_loaded) {
        LOG_WARNING_FMT("Could not load config file: {}, using defaults", config_file);
    }

    mailhub::AccountRegistry registry(config.storage().accounts_db);
    if (!registry.initialize()) {
        LOG_FATAL_FMT("Failed to open account registry: {}", registry.last_error());
        return 1;
    }

    mailhub::MailStore store(registry, config.storage().root);
    if (!store.open()) {
        LOG_FATAL_FMT("Failed to open mail store at {}", config.storage().root.string());
        return 1;
    }

    mailhub::smtp::SMTPServer smtp_server(config.smtp(), store);
    mailhub::pop3::POP3Server pop3_server(config.pop3(), store);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        smtp_server.start();
        pop3_server.start();
        LOG_INFO_FMT("mailhubd ready (SMTP port {}, POP3 port {})", smtp_server.port(),
                     pop3_server.port());

        while (g_running && smtp_server.is_running() && pop3_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        smtp_server.stop();
        pop3_server.stop();
        return 1;
    }

    LOG_INFO("Shutting down...");
    smtp_server.stop();
    pop3_server.stop();

    LOG_INFO("mailhubd shutdown complete");
    return 0;
}
