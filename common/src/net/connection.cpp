#include "net/connection.hpp"
#include "logger.hpp"

namespace mailhub {

Connection::Connection(std::chrono::seconds idle_timeout)
    : socket_(io_context_)
    , buffer_(kMaxLineLength)
    , idle_timeout_(idle_timeout) {
}

Connection::~Connection() {
    close();
}

std::string Connection::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? "unknown" : endpoint.address().to_string();
}

uint16_t Connection::remote_port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

bool Connection::run_for(std::chrono::steady_clock::duration timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Closing the socket cancels the pending operation; run until its
        // handler has been invoked.
        timed_out_ = true;
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_context_.run();
        return false;
    }
    return true;
}

std::optional<std::string> Connection::read_line() {
    if (!socket_.is_open()) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    std::size_t n = 0;
    asio::async_read_until(socket_, buffer_, '\n',
        [&](const boost::system::error_code& result_ec, std::size_t result_n) {
            ec = result_ec;
            n = result_n;
        });

    if (!run_for(idle_timeout_)) {
        LOG_DEBUG_FMT("Idle timeout on connection from {}", remote_address());
        return std::nullopt;
    }

    if (ec) {
        if (ec == asio::error::not_found) {
            LOG_WARNING_FMT("Line too long from {}", remote_address());
        } else if (ec != asio::error::eof && ec != asio::error::connection_reset) {
            LOG_DEBUG_FMT("Read error: {}", ec.message());
        }
        return std::nullopt;
    }

    auto begin = asio::buffers_begin(buffer_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(n));
    buffer_.consume(n);

    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool Connection::write(const std::string& data) {
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    if (ec) {
        LOG_DEBUG_FMT("Write error: {}", ec.message());
        return false;
    }
    return true;
}

bool Connection::write_line(const std::string& line) {
    return write(line + "\r\n");
}

void Connection::close() {
    if (socket_.is_open()) {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void Connection::run(LineSession& session) {
    session.on_connect(remote_address());

    if (write_line(session.greeting())) {
        while (!session.finished()) {
            auto line = read_line();
            if (!line) {
                break;
            }

            std::string reply = session.on_line(*line);
            if (!reply.empty() && !write_line(reply)) {
                break;
            }
        }
    }

    if (timed_out_) {
        session.on_timeout();
    }
    session.on_disconnect();
    close();
}

}  // namespace mailhub
