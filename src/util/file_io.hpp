#pragma once

#include <string>

namespace patchy {

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path);

std::string
to_string(const FileStatus status);

bool
file_exists(const std::string& path);

// Read the whole file. On failure `error` describes what went wrong.
bool
read_file(const std::string& path, std::string& content, std::string& error);

// Truncate and write. The write is not atomic.
bool
write_file(const std::string& path, const std::string& content, std::string& error);

// Create the parent directories of `path` if they are missing.
bool
create_parent_directories(const std::string& path, std::string& error);

}  // namespace patchy
