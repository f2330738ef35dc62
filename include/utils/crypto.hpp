#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace pbot {
namespace crypto {

/**
 * HMAC-SHA256, URL-safe base64 encoded. Used for Polymarket L2 request signing.
 */
std::string hmac_sha256(const std::string& key, const std::string& message);

/**
 * Base64 encoding/decoding. Decoding accepts both the standard and the
 * URL-safe alphabet (API secrets are issued URL-safe).
 */
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

// URL-safe variant ('-' and '_' instead of '+' and '/'), padding kept
std::string base64url_encode(const std::vector<uint8_t>& data);

// Lowercase hex, no prefix
std::string hex_encode(const std::vector<uint8_t>& data);

/**
 * Generate random bytes (OpenSSL RAND_bytes).
 */
std::vector<uint8_t> random_bytes(size_t count);

// Random RFC 4122 version 4 UUID, used as decision trace id
std::string generate_uuid();

} // namespace crypto
} // namespace pbot
