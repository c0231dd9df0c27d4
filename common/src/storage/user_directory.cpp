#include "storage/user_directory.hpp"
#include "logger.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <fstream>
#include <sstream>
#include <tuple>

namespace mailhub {

namespace {

constexpr const char* kSeenFile = ".seen";

// Numeric part of an id field, e.g. the digits after 'M' in "1700000000.M000123P42Q7.host".
uint64_t id_field(const std::string& id, char tag, size_t from) {
    size_t pos = id.find(tag, from);
    if (pos == std::string::npos) return 0;
    uint64_t value = 0;
    std::from_chars(id.data() + pos + 1, id.data() + id.size(), value);
    return value;
}

std::tuple<uint64_t, uint64_t, uint64_t> id_key(const std::string& id) {
    uint64_t seconds = 0;
    std::from_chars(id.data(), id.data() + id.size(), seconds);
    size_t dot = id.find('.');
    if (dot == std::string::npos) {
        return {seconds, 0, 0};
    }
    return {seconds, id_field(id, 'M', dot), id_field(id, 'Q', dot)};
}

}  // namespace

std::string folder_name(Folder folder) {
    switch (folder) {
        case Folder::Inbox: return "inbox";
        case Folder::Sent: return "sent";
        case Folder::Drafts: return "drafts";
        case Folder::Trash: return "trash";
    }
    return "inbox";
}

bool newer_id(const std::string& a, const std::string& b) {
    auto ka = id_key(a);
    auto kb = id_key(b);
    if (ka != kb) {
        return ka > kb;
    }
    return a > b;
}

UserDirectory::UserDirectory(const std::filesystem::path& root, const std::string& username)
    : user_path_(root / username) {
}

bool UserDirectory::initialize() {
    std::error_code ec;
    for (Folder folder : kAllFolders) {
        std::filesystem::create_directories(folder_path(folder), ec);
        if (ec) {
            last_error_ = "Cannot create " + folder_path(folder).string() + ": " + ec.message();
            LOG_ERROR(last_error_);
            return false;
        }
    }
    return true;
}

std::filesystem::file_time_type UserDirectory::next_stamp() {
    auto stamp = std::filesystem::file_time_type::clock::now();
    if (stamp <= last_stamp_) {
        stamp = last_stamp_ + std::chrono::microseconds(1);
    }
    last_stamp_ = stamp;
    return stamp;
}

std::filesystem::path UserDirectory::folder_path(Folder folder) const {
    return user_path_ / folder_name(folder);
}

bool UserDirectory::write(Folder folder, const Message& message) {
    auto dir = folder_path(folder);
    auto tmp_path = dir / ("." + message.id + ".tmp");
    auto final_path = dir / message.id;

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            last_error_ = "Failed to create " + tmp_path.string();
            return false;
        }
        file << message.render();
        file.flush();
        if (!file) {
            last_error_ = "Failed to write " + tmp_path.string();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::last_write_time(tmp_path, next_stamp(), ec);
    if (ec) {
        last_error_ = "Failed to stamp " + tmp_path.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }

    std::filesystem::rename(tmp_path, final_path, ec);
    if (ec) {
        last_error_ = "Failed to commit " + final_path.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

bool UserDirectory::move(const std::string& id, Folder from, Folder to) {
    std::error_code ec;
    std::filesystem::rename(folder_path(from) / id, folder_path(to) / id, ec);
    if (ec) {
        last_error_ = "Failed to move " + id + " to " + folder_name(to) + ": " + ec.message();
        return false;
    }

    // The move already happened; a stale stamp only affects order after a reload.
    std::filesystem::last_write_time(folder_path(to) / id, next_stamp(), ec);
    if (ec) {
        LOG_WARNING_FMT("Cannot stamp {} in {}: {}", id, folder_name(to), ec.message());
    }
    return true;
}

bool UserDirectory::remove(Folder folder, const std::string& id) {
    std::error_code ec;
    if (!std::filesystem::remove(folder_path(folder) / id, ec)) {
        last_error_ = ec ? ec.message() : "No such message: " + id;
        return false;
    }
    return true;
}

std::vector<Message> UserDirectory::load(Folder folder) {
    std::vector<std::pair<std::filesystem::file_time_type, Message>> stamped;
    std::vector<Message> messages;
    auto dir = folder_path(folder);

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        last_error_ = "Cannot read " + dir.string() + ": " + ec.message();
        return messages;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || !entry.is_regular_file(ec)) {
            continue;
        }

        std::ifstream file(entry.path(), std::ios::binary);
        if (!file) {
            LOG_WARNING_FMT("Cannot open {}", entry.path().string());
            continue;
        }
        std::ostringstream oss;
        oss << file.rdbuf();

        auto msg = Message::parse(name, oss.str());
        if (!msg) {
            LOG_WARNING_FMT("Skipping malformed message file {}", entry.path().string());
            continue;
        }

        auto stamp = entry.last_write_time(ec);
        if (ec) {
            stamp = std::filesystem::file_time_type::min();
        }
        last_stamp_ = std::max(last_stamp_, stamp);
        stamped.emplace_back(stamp, std::move(*msg));
    }

    std::sort(stamped.begin(), stamped.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return newer_id(a.second.id, b.second.id);
    });

    messages.reserve(stamped.size());
    for (auto& [stamp, msg] : stamped) {
        messages.push_back(std::move(msg));
    }
    return messages;
}

std::set<std::string> UserDirectory::load_seen() const {
    std::set<std::string> seen;
    std::ifstream file(user_path_ / kSeenFile);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            seen.insert(line);
        }
    }
    return seen;
}

bool UserDirectory::record_seen(const std::string& id) {
    std::ofstream file(user_path_ / kSeenFile, std::ios::app);
    if (!file) {
        last_error_ = "Cannot open " + (user_path_ / kSeenFile).string();
        return false;
    }
    file << id << '\n';
    file.flush();
    return static_cast<bool>(file);
}

bool UserDirectory::forget_seen(const std::set<std::string>& ids) {
    auto seen = load_seen();
    size_t before = seen.size();
    for (const auto& id : ids) {
        seen.erase(id);
    }
    if (seen.size() == before) {
        return true;
    }

    auto seen_path = user_path_ / kSeenFile;
    auto tmp_path = user_path_ / (std::string(kSeenFile) + ".tmp");
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            last_error_ = "Failed to create " + tmp_path.string();
            return false;
        }
        for (const auto& id : seen) {
            file << id << '\n';
        }
        file.flush();
        if (!file) {
            last_error_ = "Failed to write " + tmp_path.string();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, seen_path, ec);
    if (ec) {
        last_error_ = "Failed to replace " + seen_path.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

}  // namespace mailhub
