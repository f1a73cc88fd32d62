/**
 * @file hash_utils.cpp
 * @brief Implementation of OpenSSL digests and UUID generation
 *
 * **UUID Layout** (RFC 4122, version 4):
 * ```
 * xxxxxxxx-xxxx-4xxx-Nxxx-xxxxxxxxxxxx
 *               ^    ^
 *               |    variant bits 10xx
 *               version nibble
 * ```
 *
 * @date 2025
 */

#include "chaosbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace chaosbox {
namespace utils {

namespace {

std::string LastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // anonymous namespace

// ============================================================================
// DIGESTS
// ============================================================================

std::string HashUtils::Sha256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        std::string error = LastOpenSslError();
        spdlog::error("SHA-256 computation failed: {}", error);
        throw std::runtime_error("SHA-256 computation failed: " + error);
    }

    return ToHex(digest, digest_length);
}

// ============================================================================
// RANDOM IDENTIFIERS
// ============================================================================

std::vector<std::uint8_t> HashUtils::RandomBytes(std::size_t count) {
    std::vector<std::uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }

    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        std::string error = LastOpenSslError();
        spdlog::error("RAND_bytes failed: {}", error);
        throw std::runtime_error("Random generator failure: " + error);
    }

    return bytes;
}

std::string HashUtils::GenerateUuid() {
    auto bytes = RandomBytes(16);

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = ToHex(bytes.data(), bytes.size());

    std::ostringstream oss;
    oss << hex.substr(0, 8) << '-'
        << hex.substr(8, 4) << '-'
        << hex.substr(12, 4) << '-'
        << hex.substr(16, 4) << '-'
        << hex.substr(20, 12);
    return oss.str();
}

std::string HashUtils::ToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace chaosbox
