#include "pop3_session.hpp"
#include "logger.hpp"

namespace mailhub::pop3 {

POP3Session::POP3Session(MailStore& store, const POP3Config& config)
    : store_(store)
    , config_(config) {
}

void POP3Session::on_connect(const std::string& peer) {
    peer_ = peer;
    LOG_INFO_FMT("POP3 session started for {}", peer_);
}

std::string POP3Session::greeting() {
    return response::ok(config_.hostname + " POP3 server ready");
}

void POP3Session::on_timeout() {
    finished_ = true;
    if (transaction()) {
        size_t failures = commit_and_logout();
        LOG_INFO_FMT("POP3 {} idle timeout, session closed as by QUIT ({} failed deletion(s))",
                     peer_, failures);
    } else {
        LOG_INFO_FMT("POP3 {} idle timeout", peer_);
    }
}

void POP3Session::on_disconnect() {
    if (auto* txn = transaction()) {
        // Dropped without QUIT: pending deletions are discarded.
        LOG_INFO_FMT("POP3 {} dropped with {} pending deletion(s) for {}", peer_,
                     txn->deleted.size(), txn->user);
        store_.logout(txn->user);
        state_ = Update{};
    }
    LOG_INFO_FMT("POP3 session ended for {}", peer_);
}

std::string POP3Session::on_line(const std::string& line) {
    if (finished_) {
        return "";
    }
    return process_command(line);
}

std::string POP3Session::process_command(const std::string& line) {
    Command cmd = Command::parse(line);

    if (cmd.type == CommandType::PASS) {
        LOG_DEBUG_FMT("POP3 {} command: PASS", peer_);
    } else {
        LOG_DEBUG_FMT("POP3 {} command: {}", peer_, line);
    }

    if (cmd.type == CommandType::UNKNOWN) {
        return response::err("Unknown command");
    }

    if (std::holds_alternative<Update>(state_)) {
        return response::err("Session is closing");
    }

    if (std::holds_alternative<Authorization>(state_)) {
        switch (cmd.type) {
            case CommandType::USER:
            case CommandType::PASS:
            case CommandType::QUIT:
            case CommandType::CAPA:
                break;
            default:
                return response::err("[AUTH] Authentication required");
        }
    }

    return CommandHandler::instance().execute(*this, cmd);
}

std::string POP3Session::login(const std::string& secret) {
    auto* auth = authorization();
    if (!auth || !auth->candidate) {
        return response::err("USER command required first");
    }

    std::string user = *auth->candidate;
    if (store_.authenticate(user, secret)) {
        store_.login(user);
        Transaction txn{user, store_.snapshot_inbox(user), {}};
        state_ = std::move(txn);

        LOG_INFO_FMT("POP3 {} logged in as {} ({} messages)", peer_, user, message_count());
        return response::ok("maildrop has " + std::to_string(message_count()) + " messages (" +
                            std::to_string(total_size()) + " octets)");
    }

    auth->candidate.reset();
    ++auth->failures;
    LOG_INFO_FMT("POP3 {} authentication failed for {} ({}/{})", peer_, user,
                 auth->failures, config_.max_auth_attempts);

    if (auth->failures >= config_.max_auth_attempts) {
        finished_ = true;
        return response::err("[AUTH] Too many authentication failures, closing connection");
    }
    return response::err("[AUTH] Authentication failed");
}

const Message* POP3Session::message(size_t number) const {
    const auto* txn = transaction();
    if (!txn || number < 1 || number > txn->snapshot.size() || txn->deleted.count(number) > 0) {
        return nullptr;
    }
    return &txn->snapshot[number - 1];
}

bool POP3Session::is_deleted(size_t number) const {
    const auto* txn = transaction();
    return txn && txn->deleted.count(number) > 0;
}

size_t POP3Session::message_count() const {
    const auto* txn = transaction();
    return txn ? txn->snapshot.size() - txn->deleted.size() : 0;
}

size_t POP3Session::total_size() const {
    const auto* txn = transaction();
    if (!txn) return 0;

    size_t total = 0;
    for (size_t i = 0; i < txn->snapshot.size(); ++i) {
        if (txn->deleted.count(i + 1) == 0) {
            total += txn->snapshot[i].size();
        }
    }
    return total;
}

void POP3Session::mark_read(size_t number) {
    auto* txn = transaction();
    if (!txn || number < 1 || number > txn->snapshot.size()) return;

    auto& msg = txn->snapshot[number - 1];
    if (store_.mark_read(txn->user, msg.id)) {
        msg.read = true;
    } else {
        LOG_WARNING_FMT("Could not set read flag on {} for {}", msg.id, txn->user);
    }
}

size_t POP3Session::commit_and_logout() {
    auto* txn = transaction();
    if (!txn) return 0;

    Transaction finished_txn = std::move(*txn);
    state_ = Update{};

    size_t failures = 0;
    for (size_t number : finished_txn.deleted) {
        const auto& msg = finished_txn.snapshot[number - 1];
        if (!store_.move_to_trash(finished_txn.user, msg.id)) {
            ++failures;
        }
    }

    store_.logout(finished_txn.user);
    LOG_INFO_FMT("POP3 {} committed {} deletion(s) for {}", peer_,
                 finished_txn.deleted.size() - failures, finished_txn.user);
    return failures;
}

}  // namespace mailhub::pop3
