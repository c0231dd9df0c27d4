#pragma once

#include <memory>
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>

#include "connection.hpp"
#include "logger.hpp"

namespace mailhub {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Accepts connections for one protocol on its own thread and runs each
// session to completion on a fixed-size worker pool. Connections beyond the
// pool size wait in the pool's queue.
template<typename SessionType>
class Server {
    static_assert(std::is_base_of_v<LineSession, SessionType>,
                  "SessionType must implement LineSession");

public:
    using SessionFactory = std::function<std::unique_ptr<SessionType>()>;

    Server(const std::string& name, const std::string& bind_address,
           uint16_t port, size_t worker_count, SessionFactory factory);

    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and starts accepting. Throws boost::system::system_error when
    // the endpoint cannot be bound.
    void start();

    // Stops accepting and waits for in-flight sessions to finish.
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return bound_port_; }

    void set_idle_timeout(std::chrono::seconds timeout) { idle_timeout_ = timeout; }

protected:
    virtual void on_session_start(const Connection& connection);
    virtual void on_session_end(const Connection& connection);

private:
    void do_accept();
    void serve(std::shared_ptr<Connection> connection);

    std::string name_;
    std::string bind_address_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    size_t worker_count_;
    SessionFactory factory_;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::unique_ptr<asio::thread_pool> workers_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> active_{0};
    std::chrono::seconds idle_timeout_{600};
};

// Template implementation

template<typename SessionType>
Server<SessionType>::Server(const std::string& name, const std::string& bind_address,
                            uint16_t port, size_t worker_count, SessionFactory factory)
    : name_(name)
    , bind_address_(bind_address)
    , port_(port)
    , worker_count_(worker_count == 0 ? 1 : worker_count)
    , factory_(std::move(factory))
    , acceptor_(io_context_) {
}

template<typename SessionType>
Server<SessionType>::~Server() {
    stop();
}

template<typename SessionType>
void Server<SessionType>::start() {
    if (running_) return;

    tcp::endpoint endpoint(asio::ip::make_address(bind_address_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    workers_ = std::make_unique<asio::thread_pool>(worker_count_);
    running_ = true;
    do_accept();

    accept_thread_ = std::thread([this]() {
        io_context_.run();
    });

    LOG_INFO_FMT("{} listening on {}:{} with {} worker(s)", name_, bind_address_,
                 bound_port_, worker_count_);
}

template<typename SessionType>
void Server<SessionType>::stop() {
    if (!running_.exchange(false)) return;

    asio::post(io_context_, [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (workers_) {
        workers_->join();
        workers_.reset();
    }

    LOG_INFO_FMT("{} stopped", name_);
}

template<typename SessionType>
void Server<SessionType>::do_accept() {
    auto connection = std::make_shared<Connection>(idle_timeout_);
    acceptor_.async_accept(
        connection->socket(),
        [this, connection](const boost::system::error_code& ec) {
            if (!ec) {
                asio::post(*workers_, [this, connection]() {
                    serve(connection);
                });
            } else if (ec != asio::error::operation_aborted) {
                LOG_WARNING_FMT("{} accept failed: {}", name_, ec.message());
            }

            if (running_ && acceptor_.is_open()) {
                do_accept();
            }
        });
}

template<typename SessionType>
void Server<SessionType>::serve(std::shared_ptr<Connection> connection) {
    ++active_;
    on_session_start(*connection);

    std::unique_ptr<SessionType> session = factory_();
    if (session) {
        connection->run(*session);
    } else {
        LOG_ERROR_FMT("{} could not create a session", name_);
        connection->close();
    }

    on_session_end(*connection);
    --active_;
}

template<typename SessionType>
void Server<SessionType>::on_session_start(const Connection& connection) {
    LOG_INFO_FMT("{} connection from {}:{} ({} active)", name_, connection.remote_address(),
                 connection.remote_port(), active_.load());
}

template<typename SessionType>
void Server<SessionType>::on_session_end(const Connection& connection) {
    LOG_DEBUG_FMT("{} session finished{} ({} active)", name_,
                  connection.timed_out() ? " (idle timeout)" : "", active_.load() - 1);
}

}  // namespace mailhub
