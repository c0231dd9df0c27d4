#include "storage/mail_store.hpp"
#include "auth/account_registry.hpp"
#include "logger.hpp"
#include "strings.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <set>
#include <unistd.h>

namespace mailhub {

namespace {

using strings::lower;

std::string local_hostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "localhost";
    }
    std::string name(buffer);
    // Keep the id usable as a file name.
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), ':', '_');
    return name;
}

bool valid_username(const std::string& username) {
    if (username.empty() || username == "." || username == "..") return false;
    return std::none_of(username.begin(), username.end(), [](unsigned char c) {
        return c == '/' || c == '@' || c == '<' || c == '>' || std::isspace(c) || c < 32;
    });
}

bool valid_address(const std::string& address) {
    auto at = address.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == address.size()) return false;
    if (address.find('@', at + 1) != std::string::npos) return false;
    return std::none_of(address.begin(), address.end(), [](unsigned char c) {
        return c == '<' || c == '>' || std::isspace(c) || c < 32;
    });
}

}  // namespace

bool DeliveryReport::all_delivered() const {
    return std::all_of(results.begin(), results.end(), [](const RecipientResult& r) {
        return r.status == DeliveryStatus::Delivered;
    });
}

bool DeliveryReport::any_unknown() const {
    return std::any_of(results.begin(), results.end(), [](const RecipientResult& r) {
        return r.status == DeliveryStatus::UnknownRecipient;
    });
}

std::vector<RecipientResult> DeliveryReport::failed() const {
    std::vector<RecipientResult> out;
    std::copy_if(results.begin(), results.end(), std::back_inserter(out),
                 [](const RecipientResult& r) { return r.status != DeliveryStatus::Delivered; });
    return out;
}

std::string status_name(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Delivered: return "delivered";
        case DeliveryStatus::UnknownRecipient: return "unknown recipient";
        case DeliveryStatus::PersistenceError: return "local storage error";
    }
    return "unknown";
}

MailStore::MailStore(AccountRegistry& registry, const std::filesystem::path& root)
    : registry_(registry)
    , root_(root)
    , hostname_(local_hostname()) {
}

bool MailStore::open() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR_FMT("Cannot create mail root {}: {}", root_.string(), ec.message());
        return false;
    }

    bool ok = true;
    for (const auto& account : registry_.list_accounts()) {
        if (!register_account(account.username, account.address)) {
            ok = false;
        }
    }

    std::lock_guard<std::mutex> lock(accounts_mutex_);
    LOG_INFO_FMT("Mail store opened at {} with {} account(s)", root_.string(), by_name_.size());
    return ok;
}

bool MailStore::register_account(const std::string& username, const std::string& address) {
    auto mailbox = std::make_shared<Mailbox>(root_, username, address);
    if (!mailbox->directory.initialize()) {
        LOG_ERROR_FMT("Cannot prepare folders for {}: {}", username, mailbox->directory.last_error());
        return false;
    }

    auto seen = mailbox->directory.load_seen();
    for (Folder folder : kAllFolders) {
        auto messages = mailbox->directory.load(folder);
        for (auto& msg : messages) {
            msg.read = seen.count(msg.id) > 0;
        }
        mailbox->folder(folder).assign(std::make_move_iterator(messages.begin()),
                                       std::make_move_iterator(messages.end()));
    }

    std::lock_guard<std::mutex> lock(accounts_mutex_);
    by_name_[username] = mailbox;
    by_address_[lower(address)] = mailbox;
    return true;
}

std::shared_ptr<MailStore::Mailbox> MailStore::find(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(accounts_mutex_);
    if (auto it = by_name_.find(identifier); it != by_name_.end()) {
        return it->second;
    }
    if (auto it = by_address_.find(lower(identifier)); it != by_address_.end()) {
        return it->second;
    }
    return nullptr;
}

bool MailStore::create_user(const std::string& username, const std::string& address,
                            const std::string& secret) {
    if (!valid_username(username)) {
        LOG_WARNING_FMT("Rejected invalid username '{}'", username);
        return false;
    }
    if (!valid_address(address)) {
        LOG_WARNING_FMT("Rejected invalid address '{}'", address);
        return false;
    }
    if (find(username) || find(address)) {
        LOG_WARNING_FMT("Account {} already exists", username);
        return false;
    }

    if (!registry_.create_account(username, lower(address), secret)) {
        LOG_ERROR_FMT("Cannot register {}: {}", username, registry_.last_error());
        return false;
    }
    if (!register_account(username, lower(address))) {
        return false;
    }

    LOG_INFO_FMT("Created account {} <{}>", username, address);
    return true;
}

std::optional<UserInfo> MailStore::lookup_user(const std::string& identifier) const {
    auto mailbox = find(identifier);
    if (!mailbox) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mailbox->mutex);
    return UserInfo{mailbox->username, mailbox->address, mailbox->sessions > 0};
}

std::vector<UserInfo> MailStore::list_users() const {
    std::vector<std::shared_ptr<Mailbox>> mailboxes;
    {
        std::lock_guard<std::mutex> lock(accounts_mutex_);
        for (const auto& [name, mailbox] : by_name_) {
            mailboxes.push_back(mailbox);
        }
    }

    std::vector<UserInfo> users;
    for (const auto& mailbox : mailboxes) {
        std::lock_guard<std::mutex> lock(mailbox->mutex);
        users.push_back({mailbox->username, mailbox->address, mailbox->sessions > 0});
    }
    std::sort(users.begin(), users.end(), [](const UserInfo& a, const UserInfo& b) {
        return a.username < b.username;
    });
    return users;
}

bool MailStore::authenticate(const std::string& identifier, const std::string& secret) {
    auto mailbox = find(identifier);
    if (!mailbox) {
        return false;
    }
    return registry_.authenticate(mailbox->username, secret);
}

bool MailStore::insert_and_persist(Mailbox& mailbox, Folder folder, const Message& message) {
    if (message.id.empty()) {
        LOG_ERROR_FMT("Refusing to store a message without an id for {}", mailbox.username);
        return false;
    }

    auto& messages = mailbox.folder(folder);
    messages.push_front(message);
    messages.front().read = false;
    messages.front().bcc.clear();

    if (!mailbox.directory.write(folder, message)) {
        messages.pop_front();
        LOG_ERROR_FMT("Failed to store {} in {}/{}: {}", message.id, mailbox.username,
                      folder_name(folder), mailbox.directory.last_error());
        return false;
    }
    return true;
}

DeliveryStatus MailStore::deliver(const std::string& recipient, const Message& message) {
    auto mailbox = find(recipient);
    if (!mailbox) {
        LOG_INFO_FMT("Rejected delivery of {} to unknown recipient {}", message.id, recipient);
        return DeliveryStatus::UnknownRecipient;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    auto& inbox = mailbox->folder(Folder::Inbox);
    bool duplicate = std::any_of(inbox.begin(), inbox.end(),
                                 [&](const Message& m) { return m.id == message.id; });
    if (duplicate) {
        return DeliveryStatus::Delivered;
    }

    if (!insert_and_persist(*mailbox, Folder::Inbox, message)) {
        return DeliveryStatus::PersistenceError;
    }

    LOG_INFO_FMT("Delivered {} to {}", message.id, mailbox->username);
    return DeliveryStatus::Delivered;
}

DeliveryReport MailStore::deliver_all(Message message) {
    if (message.id.empty()) {
        message.id = allocate_id();
    }

    DeliveryReport report;
    report.message_id = message.id;

    std::unordered_map<Mailbox*, DeliveryStatus> delivered;
    for (const auto& recipient : message.recipients()) {
        auto mailbox = find(recipient);
        if (mailbox) {
            if (auto it = delivered.find(mailbox.get()); it != delivered.end()) {
                report.results.push_back({recipient, it->second});
                continue;
            }
        }

        DeliveryStatus status = deliver(recipient, message);
        if (mailbox) {
            delivered[mailbox.get()] = status;
        }
        report.results.push_back({recipient, status});
    }
    return report;
}

bool MailStore::file_message(const std::string& user, Folder folder, const Message& message) {
    auto mailbox = find(user);
    if (!mailbox) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    auto& messages = mailbox->folder(folder);
    if (std::any_of(messages.begin(), messages.end(),
                    [&](const Message& m) { return m.id == message.id; })) {
        return true;
    }
    return insert_and_persist(*mailbox, folder, message);
}

bool MailStore::move_to_trash(const std::string& user, const std::string& message_id) {
    auto mailbox = find(user);
    if (!mailbox) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    auto& trash = mailbox->folder(Folder::Trash);
    bool already_trashed = std::any_of(trash.begin(), trash.end(),
                                       [&](const Message& m) { return m.id == message_id; });

    for (Folder source : {Folder::Inbox, Folder::Sent, Folder::Drafts}) {
        auto& messages = mailbox->folder(source);
        auto it = std::find_if(messages.begin(), messages.end(),
                               [&](const Message& m) { return m.id == message_id; });
        if (it == messages.end()) {
            continue;
        }

        // A copy with the same id is already in trash; only the source goes.
        bool ok = already_trashed
            ? mailbox->directory.remove(source, message_id)
            : mailbox->directory.move(message_id, source, Folder::Trash);
        if (!ok) {
            LOG_ERROR_FMT("Failed to trash {} for {}: {}", message_id, mailbox->username,
                          mailbox->directory.last_error());
            return false;
        }

        if (!already_trashed) {
            trash.push_front(std::move(*it));
        }
        messages.erase(it);
        LOG_INFO_FMT("Moved {} from {} to trash for {}", message_id, folder_name(source),
                     mailbox->username);
        return true;
    }
    return false;
}

size_t MailStore::purge_trash(const std::string& user) {
    auto mailbox = find(user);
    if (!mailbox) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    auto& trash = mailbox->folder(Folder::Trash);
    size_t before = trash.size();

    std::set<std::string> purged_ids;
    auto kept = std::remove_if(trash.begin(), trash.end(), [&](const Message& m) {
        if (mailbox->directory.remove(Folder::Trash, m.id)) {
            purged_ids.insert(m.id);
            return true;
        }
        LOG_ERROR_FMT("Failed to purge {} for {}: {}", m.id, mailbox->username,
                      mailbox->directory.last_error());
        return false;
    });
    trash.erase(kept, trash.end());

    // A read flag is shared by every copy with the same id.
    for (const auto& messages : mailbox->folders) {
        for (const auto& m : messages) {
            purged_ids.erase(m.id);
        }
    }
    if (!mailbox->directory.forget_seen(purged_ids)) {
        LOG_WARNING_FMT("Cannot prune read flags for {}: {}", mailbox->username,
                        mailbox->directory.last_error());
    }

    size_t purged = before - trash.size();
    if (purged > 0) {
        LOG_INFO_FMT("Purged {} message(s) from trash for {}", purged, mailbox->username);
    }
    return purged;
}

bool MailStore::mark_read(const std::string& user, const std::string& message_id) {
    auto mailbox = find(user);
    if (!mailbox) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    for (auto& messages : mailbox->folders) {
        auto it = std::find_if(messages.begin(), messages.end(),
                               [&](const Message& m) { return m.id == message_id; });
        if (it == messages.end()) {
            continue;
        }
        if (it->read) {
            return true;
        }
        if (!mailbox->directory.record_seen(message_id)) {
            LOG_ERROR_FMT("Failed to record read flag of {} for {}: {}", message_id,
                          mailbox->username, mailbox->directory.last_error());
            return false;
        }
        it->read = true;
        return true;
    }
    return false;
}

std::vector<Message> MailStore::snapshot(const std::string& user, Folder folder) const {
    auto mailbox = find(user);
    if (!mailbox) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    const auto& messages = mailbox->folder(folder);
    return std::vector<Message>(messages.begin(), messages.end());
}

std::vector<Message> MailStore::snapshot_inbox(const std::string& user) const {
    return snapshot(user, Folder::Inbox);
}

bool MailStore::login(const std::string& user) {
    auto mailbox = find(user);
    if (!mailbox) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    ++mailbox->sessions;
    return true;
}

void MailStore::logout(const std::string& user) {
    auto mailbox = find(user);
    if (!mailbox) {
        return;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    if (mailbox->sessions > 0) {
        --mailbox->sessions;
    }
}

bool MailStore::is_online(const std::string& user) const {
    auto mailbox = find(user);
    if (!mailbox) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mailbox->mutex);
    return mailbox->sessions > 0;
}

std::string MailStore::allocate_id() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count() % 1000000;
    uint64_t sequence = id_counter_.fetch_add(1);

    return fmt::format("{}.M{:06}P{}Q{}.{}", seconds, micros, getpid(), sequence, hostname_);
}

}  // namespace mailhub
