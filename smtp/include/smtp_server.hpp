#pragma once

#include "net/server.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "smtp_session.hpp"
#include <memory>

namespace mailhub::smtp {

class SMTPServer {
public:
    SMTPServer(const SMTPConfig& config, MailStore& store);
    ~SMTPServer();

    SMTPServer(const SMTPServer&) = delete;
    SMTPServer& operator=(const SMTPServer&) = delete;

    void start();
    void stop();

    bool is_running() const;
    uint16_t port() const;

private:
    SMTPConfig config_;
    MailStore& store_;
    std::unique_ptr<Server<SMTPSession>> server_;
};

}  // namespace mailhub::smtp
