#include <catch2/catch.hpp>
#include "smtp_server.hpp"
#include "pop3_server.hpp"
#include "storage/mail_access.hpp"
#include "codec.hpp"
#include "test_support.hpp"
#include <boost/asio.hpp>
#include <thread>

using namespace mailhub;
using mailhub::testing::StoreFixture;

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Blocking line client for driving the servers over loopback.
class LineClient {
public:
    explicit LineClient(uint16_t port)
        : socket_(io_context_) {
        socket_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& line) {
        asio::write(socket_, asio::buffer(line + "\r\n"));
    }

    // One line without its CRLF; empty once the server has closed.
    std::string read_line() {
        boost::system::error_code ec;
        std::size_t n = asio::read_until(socket_, buffer_, "\r\n", ec);
        if (ec) {
            closed_ = true;
            return "";
        }
        auto begin = asio::buffers_begin(buffer_.data());
        std::string line(begin, begin + static_cast<std::ptrdiff_t>(n - 2));
        buffer_.consume(n);
        return line;
    }

    // Lines of an SMTP reply up to the one whose code is followed by a space.
    std::string read_smtp_reply() {
        std::string reply;
        for (;;) {
            std::string line = read_line();
            reply += line;
            if (closed_ || line.size() < 4 || line[3] != '-') {
                return reply;
            }
            reply += "\r\n";
        }
    }

    // Status line and body of a POP3 multi-line response, without the ".".
    std::string read_pop3_multi() {
        std::string status = read_line();
        if (status.rfind("+OK", 0) != 0) {
            return status;
        }
        std::string body;
        for (;;) {
            std::string line = read_line();
            if (closed_ || line == ".") {
                return status + "\r\n" + body;
            }
            body += line + "\r\n";
        }
    }

    std::string command(const std::string& line) {
        send(line);
        return read_line();
    }

    bool closed() const { return closed_; }

private:
    asio::io_context io_context_;
    tcp::socket socket_;
    asio::streambuf buffer_;
    bool closed_ = false;
};

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

template<typename ServerConfigT>
ServerConfigT loopback(ServerConfigT config) {
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.hostname = "mail.test";
    config.thread_pool_size = 2;
    return config;
}

}  // namespace

TEST_CASE("SMTP to POP3 over loopback", "[integration][flow]") {
    StoreFixture fixture;
    auto& store = fixture.store();

    smtp::SMTPServer smtp_server(loopback(SMTPConfig{}), store);
    pop3::POP3Server pop3_server(loopback(POP3Config{}), store);
    smtp_server.start();
    pop3_server.start();
    REQUIRE(smtp_server.is_running());
    REQUIRE(pop3_server.is_running());
    REQUIRE(smtp_server.port() != 0);
    REQUIRE(pop3_server.port() != 0);

    {
        LineClient client(smtp_server.port());
        REQUIRE(client.read_line() == "220 mail.test ESMTP mailhub ready");

        client.send("EHLO client.test");
        REQUIRE(starts_with(client.read_smtp_reply(), "250-mail.test Hello client.test"));

        REQUIRE(starts_with(client.command("MAIL FROM:<bob@example.com>"), "250"));
        REQUIRE(starts_with(client.command("RCPT TO:<alice@example.com>"), "250"));
        REQUIRE(starts_with(client.command("DATA"), "354"));
        client.send("Subject: Lunch");
        client.send("");
        client.send("Noon?");
        client.send("..signature");
        REQUIRE(starts_with(client.command("."), "250 OK message accepted as "));
        REQUIRE(starts_with(client.command("QUIT"), "221"));
        REQUIRE(client.read_line().empty());
        REQUIRE(client.closed());
    }

    auto inbox = store.snapshot_inbox("alice");
    REQUIRE(inbox.size() == 1);
    std::string rendering = inbox[0].render();

    {
        LineClient client(pop3_server.port());
        REQUIRE(client.read_line() == "+OK mail.test POP3 server ready");
        REQUIRE(starts_with(client.command("USER alice"), "+OK"));
        REQUIRE(starts_with(client.command("PASS wonderland"), "+OK"));

        REQUIRE(client.command("STAT") == "+OK 1 " + std::to_string(rendering.size()));

        client.send("RETR 1");
        std::string retr = client.read_pop3_multi();
        REQUIRE(retr == "+OK " + std::to_string(rendering.size()) + " octets\r\n" +
                        codec::stuff_text(rendering));
        REQUIRE(retr.find("\r\n..signature\r\n") != std::string::npos);

        REQUIRE(starts_with(client.command("DELE 1"), "+OK"));
        REQUIRE(starts_with(client.command("QUIT"), "+OK"));
        REQUIRE(client.read_line().empty());
    }

    REQUIRE(store.snapshot_inbox("alice").empty());
    REQUIRE(store.snapshot("alice", Folder::Trash).size() == 1);

    smtp_server.stop();
    pop3_server.stop();
    REQUIRE_FALSE(smtp_server.is_running());
}

TEST_CASE("Concurrent sessions share the store", "[integration][concurrency]") {
    StoreFixture fixture;
    auto& store = fixture.store();

    smtp::SMTPServer smtp_server(loopback(SMTPConfig{}), store);
    pop3::POP3Server pop3_server(loopback(POP3Config{}), store);
    smtp_server.start();
    pop3_server.start();

    // A POP3 session holds its snapshot while SMTP delivers more mail.
    MailAccess local(store);
    local.connect();
    local.submit_message("bob@example.com", {"alice@example.com"}, "before", "first\r\n");

    LineClient reader(pop3_server.port());
    reader.read_line();
    reader.command("USER alice");
    REQUIRE(starts_with(reader.command("PASS wonderland"), "+OK"));
    reader.send("UIDL");
    std::string uidl_before = reader.read_pop3_multi();

    constexpr int kSenders = 3;
    std::vector<std::thread> senders;
    for (int i = 0; i < kSenders; ++i) {
        senders.emplace_back([port = smtp_server.port(), i]() {
            LineClient client(port);
            client.read_line();
            client.command("HELO sender" + std::to_string(i));
            client.command("MAIL FROM:<bob@example.com>");
            client.command("RCPT TO:<alice@example.com>");
            client.command("DATA");
            client.send("Subject: concurrent " + std::to_string(i));
            client.send("");
            client.send("body");
            client.command(".");
            client.command("QUIT");
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    REQUIRE(store.snapshot_inbox("alice").size() == 1 + kSenders);

    reader.send("UIDL");
    REQUIRE(reader.read_pop3_multi() == uidl_before);
    REQUIRE(starts_with(reader.command("STAT"), "+OK 1 "));
    REQUIRE(starts_with(reader.command("QUIT"), "+OK"));

    smtp_server.stop();
    pop3_server.stop();
}

TEST_CASE("Idle connections are closed", "[integration][timeout]") {
    StoreFixture fixture;

    POP3Config config = loopback(POP3Config{});
    config.idle_timeout = std::chrono::seconds(1);
    pop3::POP3Server server(config, fixture.store());
    server.start();

    LineClient client(server.port());
    REQUIRE(starts_with(client.read_line(), "+OK"));
    REQUIRE(starts_with(client.command("USER alice"), "+OK"));
    REQUIRE(starts_with(client.command("PASS wonderland"), "+OK"));
    REQUIRE(fixture.store().is_online("alice"));

    REQUIRE(client.read_line().empty());
    REQUIRE(client.closed());

    // The disconnect hook runs on the worker after the socket closes.
    for (int i = 0; i < 50 && fixture.store().is_online("alice"); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE_FALSE(fixture.store().is_online("alice"));

    server.stop();
}

TEST_CASE("Idle expiry commits pending deletions", "[integration][timeout]") {
    StoreFixture fixture;
    auto& store = fixture.store();

    MailAccess local(store);
    local.connect();
    local.submit_message("bob@example.com", {"alice@example.com"}, "keep", "kept\r\n");
    local.submit_message("bob@example.com", {"alice@example.com"}, "drop", "dropped\r\n");
    auto inbox = store.snapshot_inbox("alice");
    REQUIRE(inbox.size() == 2);
    std::string dropped_id = inbox[0].id;
    std::string kept_id = inbox[1].id;

    POP3Config config = loopback(POP3Config{});
    config.idle_timeout = std::chrono::seconds(1);
    pop3::POP3Server server(config, store);
    server.start();

    {
        LineClient client(server.port());
        REQUIRE(starts_with(client.read_line(), "+OK"));
        REQUIRE(starts_with(client.command("USER alice"), "+OK"));
        REQUIRE(starts_with(client.command("PASS wonderland"), "+OK"));
        REQUIRE(starts_with(client.command("DELE 1"), "+OK"));

        REQUIRE(client.read_line().empty());
        REQUIRE(client.closed());
    }

    for (int i = 0; i < 50 && store.is_online("alice"); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE_FALSE(store.is_online("alice"));

    LineClient client(server.port());
    REQUIRE(starts_with(client.read_line(), "+OK"));
    REQUIRE(starts_with(client.command("USER alice"), "+OK"));
    REQUIRE(starts_with(client.command("PASS wonderland"), "+OK maildrop has 1 messages"));
    REQUIRE(client.command("UIDL 1") == "+OK 1 " + kept_id);
    REQUIRE(starts_with(client.command("QUIT"), "+OK"));

    auto trash = store.snapshot("alice", Folder::Trash);
    REQUIRE(trash.size() == 1);
    REQUIRE(trash[0].id == dropped_id);

    server.stop();
}

TEST_CASE("Binding a used port fails", "[integration][startup]") {
    StoreFixture fixture;

    pop3::POP3Server first(loopback(POP3Config{}), fixture.store());
    first.start();

    POP3Config taken = loopback(POP3Config{});
    taken.port = first.port();
    pop3::POP3Server second(taken, fixture.store());
    REQUIRE_THROWS_AS(second.start(), boost::system::system_error);
    REQUIRE_FALSE(second.is_running());

    first.stop();
}
