#include "pop3_server.hpp"
#include "logger.hpp"

namespace mailhub::pop3 {

POP3Server::POP3Server(const POP3Config& config, MailStore& store)
    : config_(config)
    , store_(store) {
}

POP3Server::~POP3Server() {
    stop();
}

void POP3Server::start() {
    if (server_) return;

    server_ = std::make_unique<Server<POP3Session>>(
        "POP3",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size,
        [this]() {
            return std::make_unique<POP3Session>(store_, config_);
        }
    );
    server_->set_idle_timeout(config_.idle_timeout);

    LOG_INFO_FMT("Starting POP3 server on {}:{}", config_.bind_address, config_.port);
    try {
        server_->start();
    } catch (...) {
        server_.reset();
        throw;
    }
}

void POP3Server::stop() {
    if (server_) {
        server_->stop();
        server_.reset();
        LOG_INFO("POP3 server stopped");
    }
}

bool POP3Server::is_running() const {
    return server_ && server_->is_running();
}

uint16_t POP3Server::port() const {
    return server_ ? server_->port() : config_.port;
}

}  // namespace mailhub::pop3
