#pragma once

#include "net/server.hpp"
#include "storage/mail_store.hpp"
#include "config.hpp"
#include "pop3_session.hpp"
#include <memory>

namespace mailhub::pop3 {

class POP3Server {
public:
    POP3Server(const POP3Config& config, MailStore& store);
    ~POP3Server();

    POP3Server(const POP3Server&) = delete;
    POP3Server& operator=(const POP3Server&) = delete;

    void start();
    void stop();

    bool is_running() const;

    // The bound port once started; the configured port before that.
    uint16_t port() const;

private:
    POP3Config config_;
    MailStore& store_;
    std::unique_ptr<Server<POP3Session>> server_;
};

}  // namespace mailhub::pop3
