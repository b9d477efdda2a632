#pragma once

/*
    Snapshots of file contents taken before a direct edit, so the edit can be
    undone later in the same process.

    The store is owned by whoever hosts the editing session and is handed to
    each request through an EditContext. There is no global instance.
*/

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace patchy {

struct FileBackup {
    std::string original_content;
    std::chrono::system_clock::time_point timestamp;
    std::string file_path;
};

class BackupStore {
   public:
    // Replaces an earlier snapshot of the same path.
    void
    snapshot(const std::string& path, const std::string& content);

    bool
    contains(const std::string& path) const;

    // Remove and return the snapshot of `path`.
    std::optional<FileBackup>
    take(const std::string& path);

    std::size_t
    size() const {
        return backups_.size();
    }

   private:
    std::unordered_map<std::string, FileBackup> backups_;
};

// State that lives for the length of one request.
struct EditContext {
    BackupStore& backups;
};

// "%Y-%m-%d %H:%M:%S UTC"
std::string
format_timestamp(std::chrono::system_clock::time_point timestamp);

}  // namespace patchy
