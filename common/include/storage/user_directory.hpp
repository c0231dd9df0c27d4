#pragma once

#include "storage/message.hpp"
#include <string>
#include <filesystem>
#include <vector>
#include <optional>
#include <set>
#include <array>

namespace mailhub {

enum class Folder { Inbox, Sent, Drafts, Trash };

inline constexpr std::array<Folder, 4> kAllFolders = {
    Folder::Inbox, Folder::Sent, Folder::Drafts, Folder::Trash
};

std::string folder_name(Folder folder);

// Orders message ids newest first.
bool newer_id(const std::string& a, const std::string& b);

// One user's on-disk folders: <root>/<username>/{inbox,sent,drafts,trash}/<id>
// plus a .seen file listing the ids whose read flag is set. A file's
// modification time records when it entered its folder; stamps handed out
// by one directory are strictly increasing.
class UserDirectory {
public:
    UserDirectory(const std::filesystem::path& root, const std::string& username);

    bool initialize();
    std::filesystem::path path() const { return user_path_; }
    std::filesystem::path folder_path(Folder folder) const;

    // Writes the rendering to a temporary file and renames it into place.
    bool write(Folder folder, const Message& message);
    bool move(const std::string& id, Folder from, Folder to);
    bool remove(Folder folder, const std::string& id);

    // Messages of one folder, most recently inserted first; ties fall back to
    // newest id first. Unparseable files are skipped.
    std::vector<Message> load(Folder folder);

    std::set<std::string> load_seen() const;
    bool record_seen(const std::string& id);
    // Rewrites .seen without the given ids.
    bool forget_seen(const std::set<std::string>& ids);

    std::string last_error() const { return last_error_; }

private:
    std::filesystem::file_time_type next_stamp();

    std::filesystem::path user_path_;
    std::filesystem::file_time_type last_stamp_ = std::filesystem::file_time_type::min();
    std::string last_error_;
};

}  // namespace mailhub
