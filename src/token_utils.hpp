#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace tokenauth::internal {

/// Generate a random token ID (32 hex chars from 16 random bytes)
/// @throws std::runtime_error if the random generator fails
std::string generateJti();

/// Get current Unix timestamp in seconds
std::int64_t getCurrentTimestamp();

/// Create the JWS header
/// @return JSON string: {"alg":<algorithm>,"kid":<keyId>,"typ":"JWT"}
std::string createHeader(const std::string& algorithm, int keyId);

/// Parsed token components, still encoded
struct TokenParts {
    std::string_view header_b64;
    std::string_view payload_b64;
    std::string_view signature_b64;
    std::string_view signing_input;  // "header.payload"
};

/// Split a compact token into its components
/// @param token Token in format "header.payload.signature"
/// @return TokenParts viewing into token
/// @throws std::invalid_argument if the token does not have exactly three
///         non-empty parts or exceeds MAX_TOKEN_SIZE
TokenParts parseToken(std::string_view token);

/// Decode a Base64 URL segment holding a JSON object
/// @throws std::invalid_argument or nlohmann::json::exception
nlohmann::json decodeJsonSegment(std::string_view segment_b64);

}
