#include <catch2/catch.hpp>
#include "pop3_commands.hpp"
#include "pop3_session.hpp"
#include "test_support.hpp"

using namespace mailhub;
using namespace mailhub::pop3;
using mailhub::testing::StoreFixture;

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string deliver(MailStore& store, const std::string& to, const std::string& subject,
                    const std::string& body) {
    Message msg = Message::create("bob@example.com", {to}, subject, body);
    DeliveryReport report = store.deliver_all(msg);
    REQUIRE(report.all_delivered());
    return report.message_id;
}

void login(POP3Session& session, const std::string& user, const std::string& secret) {
    REQUIRE(starts_with(session.on_line("USER " + user), "+OK"));
    REQUIRE(starts_with(session.on_line("PASS " + secret), "+OK"));
    REQUIRE(session.transaction() != nullptr);
}

}  // namespace

TEST_CASE("POP3 command parsing", "[pop3][commands]") {
    SECTION("Parse USER command") {
        auto cmd = Command::parse("USER alice@example.com");
        REQUIRE(cmd.type == CommandType::USER);
        REQUIRE(cmd.name == "USER");
        REQUIRE(cmd.argument == "alice@example.com");
    }

    SECTION("Parse PASS command keeps spaces in the secret") {
        auto cmd = Command::parse("pass open sesame");
        REQUIRE(cmd.type == CommandType::PASS);
        REQUIRE(cmd.argument == "open sesame");
    }

    SECTION("Parse TOP command") {
        auto cmd = Command::parse("TOP 1 10");
        REQUIRE(cmd.type == CommandType::TOP);
        REQUIRE(cmd.args.size() == 2);
        REQUIRE(cmd.args[0] == "1");
        REQUIRE(cmd.args[1] == "10");
    }

    SECTION("Parse commands without arguments") {
        REQUIRE(Command::parse("STAT").type == CommandType::STAT);
        REQUIRE(Command::parse("LIST").args.empty());
        REQUIRE(Command::parse("UIDL").type == CommandType::UIDL);
        REQUIRE(Command::parse("CAPA").type == CommandType::CAPA);
        REQUIRE(Command::parse("NOOP").type == CommandType::NOOP);
        REQUIRE(Command::parse("RSET").type == CommandType::RSET);
        REQUIRE(Command::parse("QUIT").type == CommandType::QUIT);
    }

    SECTION("Unknown commands") {
        REQUIRE(Command::parse("APOP x y").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("").type == CommandType::UNKNOWN);
    }
}

TEST_CASE("POP3 message numbers", "[pop3][commands]") {
    REQUIRE(parse_number("1") == 1u);
    REQUIRE(parse_number("42") == 42u);
    REQUIRE_FALSE(parse_number("").has_value());
    REQUIRE_FALSE(parse_number("-1").has_value());
    REQUIRE_FALSE(parse_number("1a").has_value());
    REQUIRE_FALSE(parse_number("abc").has_value());
}

TEST_CASE("POP3 response helpers", "[pop3][response]") {
    REQUIRE(response::ok() == "+OK");
    REQUIRE(response::ok("done") == "+OK done");
    REQUIRE(response::err("nope") == "-ERR nope");
    REQUIRE(response::multi("+OK", "a\r\nb\r\n") == "+OK\r\na\r\nb\r\n.");
}

TEST_CASE("POP3 authorization", "[pop3][auth]") {
    StoreFixture fixture;
    POP3Config config;
    POP3Session session(fixture.store(), config);
    session.on_connect("127.0.0.1:50000");

    REQUIRE(session.greeting() == "+OK localhost POP3 server ready");

    SECTION("Transaction commands require authentication") {
        for (const char* line : {"STAT", "LIST", "RETR 1", "DELE 1", "RSET", "TOP 1 1", "UIDL", "NOOP"}) {
            REQUIRE(starts_with(session.on_line(line), "-ERR [AUTH]"));
        }
        REQUIRE(session.authorization() != nullptr);
    }

    SECTION("CAPA is available before login") {
        std::string reply = session.on_line("CAPA");
        REQUIRE(starts_with(reply, "+OK"));
        for (const char* cap : {"USER\r\n", "TOP\r\n", "UIDL\r\n", "PIPELINING\r\n",
                                "RESP-CODES\r\n", "IMPLEMENTATION mailhub\r\n"}) {
            REQUIRE(reply.find(cap) != std::string::npos);
        }
        REQUIRE(reply.substr(reply.size() - 3) == "\r\n.");
    }

    SECTION("Unknown user is rejected at USER") {
        REQUIRE(starts_with(session.on_line("USER ghost"), "-ERR"));
        REQUIRE_FALSE(session.authorization()->candidate.has_value());
        REQUIRE(starts_with(session.on_line("PASS anything"), "-ERR"));
    }

    SECTION("PASS without USER") {
        REQUIRE(starts_with(session.on_line("PASS wonderland"), "-ERR"));
        REQUIRE(session.authorization() != nullptr);
    }

    SECTION("Login by address") {
        login(session, "alice@example.com", "wonderland");
        REQUIRE(session.transaction()->user == "alice");
        REQUIRE(fixture.store().is_online("alice"));
        REQUIRE(starts_with(session.on_line("USER bob"), "-ERR"));
    }

    SECTION("Wrong password clears the candidate") {
        session.on_line("USER alice");
        REQUIRE(starts_with(session.on_line("PASS wrong"), "-ERR [AUTH]"));
        REQUIRE_FALSE(session.authorization()->candidate.has_value());
        REQUIRE(session.authorization()->failures == 1);
        REQUIRE(starts_with(session.on_line("PASS wonderland"), "-ERR"));
    }

    SECTION("Too many failures end the session") {
        for (int i = 0; i < 2; ++i) {
            session.on_line("USER alice");
            session.on_line("PASS wrong");
            REQUIRE_FALSE(session.finished());
        }
        session.on_line("USER alice");
        REQUIRE(starts_with(session.on_line("PASS wrong"), "-ERR"));
        REQUIRE(session.finished());
    }

    SECTION("QUIT from authorization") {
        REQUIRE(starts_with(session.on_line("QUIT"), "+OK"));
        REQUIRE(session.finished());
    }
}

TEST_CASE("POP3 retrieval", "[pop3][retrieval]") {
    StoreFixture fixture;
    auto& store = fixture.store();
    POP3Config config;

    std::string id = deliver(store, "alice@example.com", "Hi", "Hello Alice\r\n");
    Message stored = store.snapshot_inbox("alice")[0];
    std::string rendering = stored.render();

    POP3Session session(store, config);
    login(session, "alice", "wonderland");

    SECTION("STAT reports the rendering length") {
        REQUIRE(session.on_line("STAT") == "+OK 1 " + std::to_string(rendering.size()));
    }

    SECTION("RETR returns the exact rendering") {
        std::string reply = session.on_line("RETR 1");
        REQUIRE(reply == "+OK " + std::to_string(rendering.size()) + " octets\r\n" + rendering + ".");
        REQUIRE(store.snapshot_inbox("alice")[0].read);
        REQUIRE(session.on_line("STAT") == "+OK 1 " + std::to_string(rendering.size()));
    }

    SECTION("LIST and UIDL") {
        REQUIRE(session.on_line("LIST") ==
                "+OK 1 messages (" + std::to_string(rendering.size()) + " octets)\r\n"
                "1 " + std::to_string(rendering.size()) + "\r\n.");
        REQUIRE(session.on_line("LIST 1") == "+OK 1 " + std::to_string(rendering.size()));
        REQUIRE(session.on_line("UIDL") == "+OK\r\n1 " + id + "\r\n.");
        REQUIRE(session.on_line("UIDL 1") == "+OK 1 " + id);
    }

    SECTION("Bad message numbers") {
        REQUIRE(starts_with(session.on_line("RETR"), "-ERR"));
        REQUIRE(starts_with(session.on_line("RETR 0"), "-ERR"));
        REQUIRE(starts_with(session.on_line("RETR 2"), "-ERR"));
        REQUIRE(starts_with(session.on_line("RETR one"), "-ERR"));
        REQUIRE(starts_with(session.on_line("LIST 9"), "-ERR"));
        REQUIRE(starts_with(session.on_line("TOP 1"), "-ERR"));
        REQUIRE(starts_with(session.on_line("TOP 1 x"), "-ERR"));
        REQUIRE(starts_with(session.on_line("BOGUS"), "-ERR"));
        REQUIRE(session.transaction() != nullptr);
    }

    SECTION("NOOP") {
        REQUIRE(session.on_line("NOOP") == "+OK");
    }
}

TEST_CASE("POP3 dot-stuffing on retrieval", "[pop3][retrieval]") {
    StoreFixture fixture;
    auto& store = fixture.store();
    deliver(store, "alice", "dots", ".\r\n..two\r\nplain\r\n");

    POP3Session session(store, POP3Config{});
    login(session, "alice", "wonderland");

    std::string reply = session.on_line("RETR 1");
    REQUIRE(reply.find("\r\n..\r\n...two\r\nplain\r\n.") != std::string::npos);
    REQUIRE(reply.substr(reply.size() - 3) == "\r\n.");
}

TEST_CASE("POP3 TOP", "[pop3][top]") {
    StoreFixture fixture;
    auto& store = fixture.store();
    deliver(store, "alice", "Lines", "one\r\ntwo\r\nthree\r\n");
    Message stored = store.snapshot_inbox("alice")[0];

    POP3Session session(store, POP3Config{});
    login(session, "alice", "wonderland");

    SECTION("Zero lines gives the headers and the blank line") {
        REQUIRE(session.on_line("TOP 1 0") ==
                "+OK Top of message follows\r\n" + stored.header_block() + "\r\n.");
    }

    SECTION("First body lines") {
        REQUIRE(session.on_line("TOP 1 2") ==
                "+OK Top of message follows\r\n" + stored.header_block() + "\r\none\r\ntwo\r\n.");
    }

    SECTION("More lines than the body has") {
        REQUIRE(session.on_line("TOP 1 10") ==
                "+OK Top of message follows\r\n" + stored.render() + ".");
    }

    SECTION("TOP does not set the read flag") {
        session.on_line("TOP 1 1");
        REQUIRE_FALSE(store.snapshot_inbox("alice")[0].read);
    }
}

TEST_CASE("POP3 snapshot stability", "[pop3][snapshot]") {
    StoreFixture fixture;
    auto& store = fixture.store();
    std::string first = deliver(store, "alice", "first", "1\r\n");
    std::string second = deliver(store, "alice", "second", "2\r\n");

    POP3Session session(store, POP3Config{});
    login(session, "alice", "wonderland");

    std::string uidl_before = session.on_line("UIDL");
    std::string list_before = session.on_line("LIST");
    REQUIRE(uidl_before == "+OK\r\n1 " + second + "\r\n2 " + first + "\r\n.");

    SECTION("A delivery during the session does not renumber messages") {
        deliver(store, "alice", "third", "3\r\n");
        REQUIRE(store.snapshot_inbox("alice").size() == 3);

        REQUIRE(session.on_line("UIDL") == uidl_before);
        REQUIRE(session.on_line("LIST") == list_before);
        REQUIRE(session.on_line("STAT").rfind("+OK 2 ", 0) == 0);
        REQUIRE(session.on_line("RETR 1").find("Subject: second\r\n") != std::string::npos);
    }

    SECTION("UIDL is unique and stable across sessions") {
        REQUIRE(first != second);
        session.on_line("QUIT");

        POP3Session again(store, POP3Config{});
        login(again, "alice", "wonderland");
        REQUIRE(again.on_line("UIDL") == uidl_before);
    }
}

TEST_CASE("POP3 deferred deletion", "[pop3][dele]") {
    StoreFixture fixture;
    auto& store = fixture.store();
    std::string older = deliver(store, "alice", "older", "a\r\n");
    std::string newer = deliver(store, "alice", "newer", "b\r\n");
    size_t newer_size = store.snapshot_inbox("alice")[0].size();
    size_t older_size = store.snapshot_inbox("alice")[1].size();

    POP3Session session(store, POP3Config{});
    login(session, "alice", "wonderland");

    SECTION("DELE marks without touching the store") {
        REQUIRE(starts_with(session.on_line("DELE 1"), "+OK"));
        REQUIRE(session.on_line("STAT") == "+OK 1 " + std::to_string(older_size));
        REQUIRE(session.on_line("LIST") ==
                "+OK 1 messages (" + std::to_string(older_size) + " octets)\r\n"
                "2 " + std::to_string(older_size) + "\r\n.");
        REQUIRE(session.on_line("UIDL") == "+OK\r\n2 " + older + "\r\n.");
        REQUIRE(starts_with(session.on_line("RETR 1"), "-ERR"));
        REQUIRE(starts_with(session.on_line("TOP 1 0"), "-ERR"));
        REQUIRE(starts_with(session.on_line("DELE 1"), "-ERR"));
        REQUIRE(store.snapshot_inbox("alice").size() == 2);
    }

    SECTION("RSET unmarks") {
        session.on_line("DELE 1");
        session.on_line("DELE 2");
        REQUIRE(session.on_line("STAT") == "+OK 0 0");
        REQUIRE(starts_with(session.on_line("RSET"), "+OK"));
        REQUIRE(session.on_line("STAT") ==
                "+OK 2 " + std::to_string(newer_size + older_size));
        REQUIRE(starts_with(session.on_line("RETR 1"), "+OK"));
    }

    SECTION("QUIT moves deleted messages to trash") {
        session.on_line("DELE 2");
        REQUIRE(starts_with(session.on_line("QUIT"), "+OK"));
        REQUIRE(session.finished());
        REQUIRE(std::holds_alternative<Update>(session.state()));
        REQUIRE_FALSE(store.is_online("alice"));

        auto inbox = store.snapshot_inbox("alice");
        auto trash = store.snapshot("alice", Folder::Trash);
        REQUIRE(inbox.size() == 1);
        REQUIRE(inbox[0].id == newer);
        REQUIRE(trash.size() == 1);
        REQUIRE(trash[0].id == older);
    }

    SECTION("A dropped connection commits nothing") {
        session.on_line("DELE 1");
        session.on_disconnect();

        REQUIRE(store.snapshot_inbox("alice").size() == 2);
        REQUIRE(store.snapshot("alice", Folder::Trash).empty());
        REQUIRE_FALSE(store.is_online("alice"));
    }

    SECTION("An idle timeout commits like QUIT") {
        session.on_line("DELE 1");
        session.on_timeout();
        session.on_disconnect();

        REQUIRE(session.finished());
        auto inbox = store.snapshot_inbox("alice");
        REQUIRE(inbox.size() == 1);
        REQUIRE(inbox[0].id == older);
        auto trash = store.snapshot("alice", Folder::Trash);
        REQUIRE(trash.size() == 1);
        REQUIRE(trash[0].id == newer);
        REQUIRE_FALSE(store.is_online("alice"));
    }

    SECTION("Messages trashed elsewhere make QUIT report an error") {
        session.on_line("DELE 1");
        REQUIRE(store.move_to_trash("alice", newer));
        REQUIRE(starts_with(session.on_line("QUIT"), "-ERR"));
        REQUIRE(session.finished());
    }
}
