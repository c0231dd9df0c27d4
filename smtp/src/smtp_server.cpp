#include "smtp_server.hpp"
#include "logger.hpp"

namespace mailhub::smtp {

SMTPServer::SMTPServer(const SMTPConfig& config, MailStore& store)
    : config_(config)
    , store_(store) {
}

SMTPServer::~SMTPServer() {
    stop();
}

void SMTPServer::start() {
    if (server_) return;

    server_ = std::make_unique<Server<SMTPSession>>(
        "SMTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size,
        [this]() {
            return std::make_unique<SMTPSession>(store_, config_);
        }
    );
    server_->set_idle_timeout(config_.idle_timeout);

    LOG_INFO_FMT("Starting SMTP server on {}:{}", config_.bind_address, config_.port);
    try {
        server_->start();
    } catch (...) {
        server_.reset();
        throw;
    }
}

void SMTPServer::stop() {
    if (server_) {
        server_->stop();
        server_.reset();
        LOG_INFO("SMTP server stopped");
    }
}

bool SMTPServer::is_running() const {
    return server_ && server_->is_running();
}

uint16_t SMTPServer::port() const {
    return server_ ? server_->port() : config_.port;
}

}  // namespace mailhub::smtp
