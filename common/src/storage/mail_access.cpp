#include "storage/mail_access.hpp"
#include "logger.hpp"

namespace mailhub {

MailAccess::MailAccess(MailStore& store)
    : store_(store) {
}

MailAccess::~MailAccess() {
    disconnect();
}

void MailAccess::connect() {
    connected_ = true;
}

bool MailAccess::authenticate(const std::string& user, const std::string& secret) {
    if (!connected_ || user_) {
        return false;
    }

    auto info = store_.lookup_user(user);
    if (!info || !store_.authenticate(user, secret)) {
        LOG_INFO_FMT("Local access login failed for {}", user);
        return false;
    }

    store_.login(info->username);
    user_ = info->username;
    snapshot_ = store_.snapshot_inbox(*user_);
    return true;
}

bool MailAccess::refresh() {
    if (!user_) {
        return false;
    }
    snapshot_ = store_.snapshot_inbox(*user_);
    return true;
}

std::vector<std::pair<size_t, size_t>> MailAccess::list_inbox_summaries() const {
    std::vector<std::pair<size_t, size_t>> summaries;
    summaries.reserve(snapshot_.size());
    for (size_t i = 0; i < snapshot_.size(); ++i) {
        summaries.emplace_back(i + 1, snapshot_[i].size());
    }
    return summaries;
}

std::optional<std::string> MailAccess::fetch_message(size_t number) {
    if (!user_ || number == 0 || number > snapshot_.size()) {
        return std::nullopt;
    }

    auto& msg = snapshot_[number - 1];
    if (store_.mark_read(*user_, msg.id)) {
        msg.read = true;
    }
    return msg.render();
}

DeliveryReport MailAccess::submit_message(const std::string& sender,
                                          const std::vector<std::string>& recipients,
                                          const std::string& subject,
                                          const std::string& body) {
    Message msg = Message::create(sender, recipients, subject, body);
    msg.id = store_.allocate_id();

    DeliveryReport report = store_.deliver_all(msg);
    if (user_ && !store_.file_message(*user_, Folder::Sent, msg)) {
        LOG_WARNING_FMT("Could not file {} in sent folder of {}", msg.id, *user_);
    }
    return report;
}

void MailAccess::disconnect() {
    if (user_) {
        store_.logout(*user_);
        user_.reset();
    }
    snapshot_.clear();
    connected_ = false;
}

}  // namespace mailhub
