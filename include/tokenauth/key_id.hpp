#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tokenauth {

/// Derive a key identifier from a key file name
/// @param path Path to the key file, only its file name is matched
/// @param pattern Regex matched against the whole file name; the first
///        capture group must be a non-negative integer
/// @return the identifier, or KEY_ID_ZERO if anything does not match
[[nodiscard]] int keyIdFromPath(const std::string& path, const std::string& pattern);

/// Read the "kid" header of a token without verifying it
///
/// Advisory only, used to pick the handler that will verify the token.
/// Accepts a floating point, signed or unsigned JSON number.
/// @return the identifier, or std::nullopt if the token is unparsable or
///         has no usable "kid"
[[nodiscard]] std::optional<int> findKeyId(std::string_view token) noexcept;

/// findKeyId, falling back to KEY_ID_ZERO
[[nodiscard]] int getKeyId(std::string_view token) noexcept;

}
