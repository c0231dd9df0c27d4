#include <catch2/catch.hpp>
#include "storage/message.hpp"

using namespace mailhub;

namespace {

Message sample() {
    Message msg = Message::create("alice@example.com", {"bob@example.com"}, "Hi", "Hello Bob\r\n");
    msg.id = "1700000000.M000001P42Q1.host";
    msg.created_at = std::chrono::system_clock::from_time_t(1700000000);
    return msg;
}

}  // namespace

TEST_CASE("Message rendering", "[message]") {
    Message msg = sample();

    SECTION("Canonical header order") {
        REQUIRE(msg.render() ==
                "From: alice@example.com\r\n"
                "To: bob@example.com\r\n"
                "Subject: Hi\r\n"
                "Date: Tue, 14 Nov 2023 22:13:20 +0000\r\n"
                "Message-ID: <1700000000.M000001P42Q1.host>\r\n"
                "\r\n"
                "Hello Bob\r\n");
    }

    SECTION("Size is the rendering length") {
        REQUIRE(msg.size() == msg.render().size());
    }

    SECTION("Cc is rendered, Bcc is not") {
        msg.cc = {"carol@example.com", "dave@example.com"};
        msg.bcc = {"eve@example.com"};
        std::string rendering = msg.render();
        REQUIRE(rendering.find("Cc: carol@example.com, dave@example.com\r\n") != std::string::npos);
        REQUIRE(rendering.find("eve@example.com") == std::string::npos);
    }

    SECTION("Read flag does not change the size") {
        size_t before = msg.size();
        msg.read = true;
        REQUIRE(msg.size() == before);
    }

    SECTION("Body line endings become CRLF") {
        msg.body = "one\ntwo";
        std::string rendering = msg.render();
        REQUIRE(rendering.substr(rendering.find("\r\n\r\n") + 4) == "one\r\ntwo\r\n");
    }
}

TEST_CASE("Message recipients", "[message]") {
    Message msg = sample();
    msg.to = {"a@x", "b@x"};
    msg.cc = {"b@x", "c@x"};
    msg.bcc = {"d@x", "a@x"};

    REQUIRE(msg.recipients() == std::vector<std::string>{"a@x", "b@x", "c@x", "d@x"});
}

TEST_CASE("Message from SMTP payload", "[message]") {
    std::vector<std::string> rcpts = {"bob@example.com"};

    SECTION("Subject is extracted and other headers pass through") {
        std::string payload =
            "Subject: Hello\r\n"
            "X-Mailer: test\r\n"
            "\r\n"
            "Body line\r\n";
        Message msg = Message::from_payload(payload, "alice@example.com", rcpts);

        REQUIRE(msg.subject == "Hello");
        REQUIRE(msg.sender == "alice@example.com");
        REQUIRE(msg.to == rcpts);
        REQUIRE(msg.extra_headers == std::vector<std::string>{"X-Mailer: test"});
        REQUIRE(msg.body == "Body line\r\n");
    }

    SECTION("Generated headers in the payload are replaced") {
        std::string payload =
            "From: forged@example.com\r\n"
            "Date: yesterday\r\n"
            "Subject: S\r\n"
            "\r\n"
            "text\r\n";
        Message msg = Message::from_payload(payload, "alice@example.com", rcpts);

        REQUIRE(msg.extra_headers.empty());
        std::string rendering = msg.render();
        REQUIRE(rendering.find("forged") == std::string::npos);
        REQUIRE(rendering.find("From: alice@example.com\r\n") == 0);
    }

    SECTION("Folded Subject is unfolded") {
        std::string payload =
            "Subject: a long\r\n"
            " subject line\r\n"
            "\r\n"
            "x\r\n";
        Message msg = Message::from_payload(payload, "alice@example.com", rcpts);
        REQUIRE(msg.subject == "a long subject line");
    }

    SECTION("Payload without headers is all body") {
        std::string payload = "Just some text\r\nwith: a colon later\r\n";
        Message msg = Message::from_payload(payload, "alice@example.com", rcpts);

        REQUIRE(msg.subject.empty());
        REQUIRE(msg.extra_headers.empty());
        REQUIRE(msg.body == payload);
    }
}

TEST_CASE("Message parse", "[message]") {
    Message msg = sample();
    msg.cc = {"carol@example.com"};
    msg.extra_headers = {"X-Tag: one", " folded"};

    auto parsed = Message::parse(msg.id, msg.render());
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->id == msg.id);
    REQUIRE(parsed->sender == msg.sender);
    REQUIRE(parsed->to == msg.to);
    REQUIRE(parsed->cc == msg.cc);
    REQUIRE(parsed->subject == msg.subject);
    REQUIRE(parsed->created_at == msg.created_at);
    REQUIRE(parsed->extra_headers == msg.extra_headers);
    REQUIRE(parsed->render() == msg.render());

    SECTION("Missing required headers are rejected") {
        REQUIRE_FALSE(Message::parse("x", "Subject: only\r\n\r\nbody\r\n").has_value());
        REQUIRE_FALSE(Message::parse("x", "no separator").has_value());
    }
}

TEST_CASE("Date formatting", "[message]") {
    auto tp = std::chrono::system_clock::from_time_t(0);
    REQUIRE(format_date(tp) == "Thu, 01 Jan 1970 00:00:00 +0000");

    auto parsed = parse_date("Tue, 14 Nov 2023 22:13:20 +0000");
    REQUIRE(parsed.has_value());
    REQUIRE(std::chrono::system_clock::to_time_t(*parsed) == 1700000000);
}
