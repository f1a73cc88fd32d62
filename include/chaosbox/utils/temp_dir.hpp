/**
 * @file temp_dir.hpp
 * @brief RAII temporary directory
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace chaosbox {
namespace utils {

/**
 * @class ScopedTempDir
 * @brief Uniquely named directory removed recursively on destruction
 *
 * Created with mkdtemp(3) so concurrent jobs never share a directory.
 * Move-only.
 */
class ScopedTempDir {
public:
    /**
     * @brief Create a directory under a root
     * @param root Parent directory (created if missing)
     * @param prefix Directory name prefix
     * @throws std::filesystem::filesystem_error on failure
     */
    ScopedTempDir(const std::filesystem::path& root, const std::string& prefix);

    ~ScopedTempDir();

    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    /**
     * @brief Write a file inside the directory
     * @param name File name relative to the directory
     * @param content File content
     * @return Full path of the written file
     * @throws std::filesystem::filesystem_error on failure
     */
    std::filesystem::path WriteFile(const std::string& name, const std::string& content) const;

    /// Remove the directory now; later calls are no-ops
    void Remove() noexcept;

private:
    std::filesystem::path path_;
};

} // namespace utils
} // namespace chaosbox
