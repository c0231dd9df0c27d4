#pragma once

#include "storage/message.hpp"
#include "storage/user_directory.hpp"
#include <string>
#include <filesystem>
#include <vector>
#include <deque>
#include <array>
#include <optional>
#include <memory>
#include <mutex>
#include <atomic>
#include <unordered_map>

namespace mailhub {

class AccountRegistry;

struct UserInfo {
    std::string username;
    std::string address;
    bool online = false;
};

enum class DeliveryStatus { Delivered, UnknownRecipient, PersistenceError };

struct RecipientResult {
    std::string recipient;
    DeliveryStatus status = DeliveryStatus::Delivered;
};

struct DeliveryReport {
    std::string message_id;
    std::vector<RecipientResult> results;

    bool all_delivered() const;
    bool any_unknown() const;
    std::vector<RecipientResult> failed() const;
};

std::string status_name(DeliveryStatus status);

// Accounts and their folders, in memory and on disk. Every mutation of one
// user's folders holds that user's mutex and is written to disk before it
// is reported as done. Read accessors return copies.
class MailStore {
public:
    MailStore(AccountRegistry& registry, const std::filesystem::path& root);

    MailStore(const MailStore&) = delete;
    MailStore& operator=(const MailStore&) = delete;

    // Loads every registered account and its folders from disk.
    bool open();

    bool create_user(const std::string& username, const std::string& address,
                     const std::string& secret);

    // identifier is either the username or the address
    std::optional<UserInfo> lookup_user(const std::string& identifier) const;
    std::vector<UserInfo> list_users() const;
    bool authenticate(const std::string& identifier, const std::string& secret);

    // Inserts at the head of the recipient's inbox and persists it. A failed
    // write leaves the inbox unchanged.
    DeliveryStatus deliver(const std::string& recipient, const Message& message);

    // Delivers to every recipient of the message; each account receives at
    // most one copy. Allocates an id when the message has none.
    DeliveryReport deliver_all(Message message);

    bool file_message(const std::string& user, Folder folder, const Message& message);
    bool move_to_trash(const std::string& user, const std::string& message_id);
    size_t purge_trash(const std::string& user);
    bool mark_read(const std::string& user, const std::string& message_id);

    std::vector<Message> snapshot(const std::string& user, Folder folder) const;
    std::vector<Message> snapshot_inbox(const std::string& user) const;

    bool login(const std::string& user);
    void logout(const std::string& user);
    bool is_online(const std::string& user) const;

    std::string allocate_id();

    const std::filesystem::path& root() const { return root_; }

private:
    struct Mailbox {
        Mailbox(const std::filesystem::path& root, const std::string& name, const std::string& addr)
            : username(name), address(addr), directory(root, name) {}

        std::string username;
        std::string address;
        UserDirectory directory;
        std::array<std::deque<Message>, 4> folders;  // newest first
        size_t sessions = 0;
        mutable std::mutex mutex;

        std::deque<Message>& folder(Folder f) { return folders[static_cast<size_t>(f)]; }
        const std::deque<Message>& folder(Folder f) const { return folders[static_cast<size_t>(f)]; }
    };

    std::shared_ptr<Mailbox> find(const std::string& identifier) const;
    bool register_account(const std::string& username, const std::string& address);
    bool insert_and_persist(Mailbox& mailbox, Folder folder, const Message& message);

    AccountRegistry& registry_;
    std::filesystem::path root_;
    std::string hostname_;
    std::atomic<uint64_t> id_counter_{0};

    mutable std::mutex accounts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Mailbox>> by_name_;
    std::unordered_map<std::string, std::shared_ptr<Mailbox>> by_address_;
};

}  // namespace mailhub
