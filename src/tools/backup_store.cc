#include "backup_store.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

using namespace patchy;

void
BackupStore::snapshot(const std::string& path, const std::string& content) {
    backups_[path] = FileBackup{content, std::chrono::system_clock::now(), path};
}

bool
BackupStore::contains(const std::string& path) const {
    return backups_.find(path) != backups_.end();
}

std::optional<FileBackup>
BackupStore::take(const std::string& path) {
    auto it = backups_.find(path);
    if (it == backups_.end()) {
        return std::nullopt;
    }
    FileBackup backup = std::move(it->second);
    backups_.erase(it);
    return backup;
}

std::string
patchy::format_timestamp(std::chrono::system_clock::time_point timestamp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%Y-%m-%d %H:%M:%S} UTC", fmt::gmtime(t));
}
