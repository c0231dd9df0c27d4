#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace mailhub {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// A line-oriented protocol conversation. Replies are returned without the
// final CRLF; an empty reply sends nothing.
class LineSession {
public:
    virtual ~LineSession() = default;

    virtual void on_connect(const std::string& /* peer */) {}
    virtual std::string greeting() = 0;
    virtual std::string on_line(const std::string& line) = 0;
    virtual bool finished() const = 0;
    // Runs before on_disconnect when the peer stayed idle past the timeout.
    virtual void on_timeout() {}
    virtual void on_disconnect() {}
};

// One accepted socket, driven by blocking reads and writes on its own
// io_context. Each read is bounded by the idle timeout.
class Connection {
public:
    static constexpr size_t kMaxLineLength = 64 * 1024;

    explicit Connection(std::chrono::seconds idle_timeout = std::chrono::seconds(600));
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    tcp::socket& socket() { return socket_; }

    std::string remote_address() const;
    uint16_t remote_port() const;

    // Next line with LF or CRLF removed; nullopt on EOF, error or timeout.
    std::optional<std::string> read_line();

    bool write(const std::string& data);
    bool write_line(const std::string& line);

    void close();

    bool timed_out() const { return timed_out_; }

    // Greets, feeds lines to the session until it finishes or the peer goes
    // away, then runs the timeout hook if the last read expired, the
    // disconnect hook, and closes the socket.
    void run(LineSession& session);

private:
    bool run_for(std::chrono::steady_clock::duration timeout);

    asio::io_context io_context_;
    tcp::socket socket_;
    asio::streambuf buffer_;
    std::chrono::seconds idle_timeout_;
    bool timed_out_ = false;
};

}  // namespace mailhub
