#include "file_io.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

patchy::FileStatus
patchy::check_file_status(const std::string& path) {
    if (path.empty() || path == "/dev/null" || path == "nul") {
        return FileStatus::kNullPath;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_symlink(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
patchy::to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
        default:
            return "Unknown error";
    }
}

bool
patchy::file_exists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(fs::path(path), ec);
}

bool
patchy::read_file(const std::string& path, std::string& content, std::string& error) {
    content.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        error = fmt::format("Failed to open '{}' for reading: {}", path, strerror(errno));
        return false;
    }

    char buffer[4096];
    std::size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        content.append(buffer, count);
    }

    if (ferror(stream)) {
        error = fmt::format("Failed to read '{}': {}", path, strerror(errno));
        fclose(stream);
        return false;
    }

    fclose(stream);
    return true;
}

bool
patchy::write_file(const std::string& path, const std::string& content, std::string& error) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        error = fmt::format("Failed to open '{}' for writing: {}", path, strerror(errno));
        return false;
    }

    if (!content.empty() && fwrite(content.data(), content.size(), 1, stream) != 1) {
        error = fmt::format("Failed to write '{}': {}", path, strerror(errno));
        fclose(stream);
        return false;
    }

    if (fclose(stream) != 0) {
        error = fmt::format("Failed to close '{}': {}", path, strerror(errno));
        return false;
    }
    return true;
}

bool
patchy::create_parent_directories(const std::string& path, std::string& error) {
    auto parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code ec;
    if (fs::exists(parent, ec)) {
        return true;
    }

    fs::create_directories(parent, ec);
    if (ec) {
        error = fmt::format("Failed to create directory '{}': {}", parent.string(), ec.message());
        return false;
    }
    return true;
}
