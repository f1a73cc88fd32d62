/**
 * @file hash_utils.hpp
 * @brief OpenSSL-backed digests and random identifiers
 *
 * Provides the SHA-256 digest used to fingerprint staged sources in job logs
 * and the RFC 4122 version 4 UUIDs used as job identifiers. Both draw on
 * OpenSSL (EVP digests and the CSPRNG behind RAND_bytes), so identifiers
 * stay unique across threads without any shared generator state.
 *
 * **Error Handling**:
 * - OpenSSL failures: Logs and throws std::runtime_error
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace chaosbox {
namespace utils {

/**
 * @class HashUtils
 * @brief Digest and identifier helpers
 *
 * **Usage Example**:
 * @code
 * std::string job_id = HashUtils::GenerateUuid();
 * // "3f2b8c1e-9a4d-4f6e-b1c2-7d8e9f0a1b2c"
 *
 * std::string digest = HashUtils::Sha256(source_code);
 * spdlog::debug("Staged source sha256={}", digest);
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a string
     * @param data Input bytes
     * @return Lowercase hexadecimal digest (64 characters)
     * @throws std::runtime_error if the OpenSSL digest fails
     */
    static std::string Sha256(const std::string& data);

    /**
     * @brief Generate a random version 4 UUID
     * @return Canonical 36-character lowercase UUID string
     * @throws std::runtime_error if the OpenSSL CSPRNG fails
     */
    static std::string GenerateUuid();

    /**
     * @brief Fill a buffer with cryptographically secure random bytes
     * @param count Number of bytes
     * @return Random bytes
     * @throws std::runtime_error if the OpenSSL CSPRNG fails
     */
    static std::vector<std::uint8_t> RandomBytes(std::size_t count);

    /**
     * @brief Convert binary data to lowercase hex
     * @param data Binary data
     * @param length Number of bytes
     * @return Hex string
     */
    static std::string ToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace chaosbox
