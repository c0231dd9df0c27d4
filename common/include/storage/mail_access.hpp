#pragma once

#include "storage/mail_store.hpp"
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace mailhub {

// In-process client of the store for collaborators that do not speak a wire
// protocol. Mirrors one POP3 retrieval session plus SMTP submission.
class MailAccess {
public:
    explicit MailAccess(MailStore& store);
    ~MailAccess();

    MailAccess(const MailAccess&) = delete;
    MailAccess& operator=(const MailAccess&) = delete;

    void connect();
    bool connected() const { return connected_; }

    // Logs in and takes the inbox snapshot used for message numbering.
    bool authenticate(const std::string& user, const std::string& secret);
    bool authenticated() const { return user_.has_value(); }

    // Replaces the snapshot with the current inbox.
    bool refresh();

    // (message number, size) pairs, numbered from 1.
    std::vector<std::pair<size_t, size_t>> list_inbox_summaries() const;

    // Rendering of message n; sets its read flag in the store.
    std::optional<std::string> fetch_message(size_t number);

    DeliveryReport submit_message(const std::string& sender,
                                  const std::vector<std::string>& recipients,
                                  const std::string& subject,
                                  const std::string& body);

    void disconnect();

private:
    MailStore& store_;
    bool connected_ = false;
    std::optional<std::string> user_;
    std::vector<Message> snapshot_;
};

}  // namespace mailhub
