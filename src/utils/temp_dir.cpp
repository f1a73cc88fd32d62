/**
 * @file temp_dir.cpp
 * @brief RAII temporary directory implementation
 *
 * @date 2025
 */

#include "chaosbox/utils/temp_dir.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace chaosbox {
namespace utils {

ScopedTempDir::ScopedTempDir(const fs::path& root, const std::string& prefix) {
    fs::create_directories(root);

    std::string pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw fs::filesystem_error("mkdtemp failed", fs::path(pattern),
                                   std::error_code(errno, std::generic_category()));
    }

    path_ = buffer.data();

    // Containers may run as a non-root user; the mount is read-only anyway
    fs::permissions(path_,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);

    spdlog::debug("Created temp directory: {}", path_.string());
}

ScopedTempDir::~ScopedTempDir() {
    Remove();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

fs::path ScopedTempDir::WriteFile(const std::string& name, const std::string& content) const {
    fs::path file_path = path_ / name;

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw fs::filesystem_error("Cannot open file for writing", file_path,
                                   std::make_error_code(std::errc::io_error));
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw fs::filesystem_error("Failed to write file", file_path,
                                   std::make_error_code(std::errc::io_error));
    }

    fs::permissions(file_path,
                    fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    return file_path;
}

void ScopedTempDir::Remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp directory {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("Removed temp directory: {}", path_.string());
    }
    path_.clear();
}

} // namespace utils
} // namespace chaosbox
