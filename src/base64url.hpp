#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace tokenauth {
namespace internal {

/// Encode bytes to Base64 URL format (RFC 4648, no padding)
std::string base64url_encode(std::span<const std::uint8_t> data);

/// Encode a string's bytes to Base64 URL format
std::string base64url_encode(std::string_view text);

/// Decode unpadded Base64 URL (RFC 7515 section 2)
/// @param input Base64 URL encoded string
/// @return Decoded bytes
/// @throws std::invalid_argument on padding, characters outside the
///         alphabet, an impossible length or non-zero trailing bits
std::vector<std::uint8_t> base64url_decode(std::string_view input);

/// Decode Base64 URL into a string
std::string base64url_decode_string(std::string_view input);

} // namespace internal
} // namespace tokenauth
