#pragma once
#include <cstddef>

namespace tokenauth {

// Key identifier used when none can be derived or found
inline constexpr int KEY_ID_ZERO = 0;

// Default private key filename pattern, first capture group is the key id
inline constexpr const char* DEFAULT_KEY_FILENAME_PATTERN = R"(private\.id\.([0-9]*)\.pem)";

// JWT header values
inline constexpr const char* JWT_TYPE = "JWT";
inline constexpr const char* ALG_RS256 = "RS256";
inline constexpr const char* ALG_EDDSA = "EdDSA";

// Header field carrying the key identifier
inline constexpr const char* KEY_ID_HEADER = "kid";

// PEM labels accepted by the key loader
inline constexpr const char* PEM_LABEL_PKCS1 = "RSA PRIVATE KEY";
inline constexpr const char* PEM_LABEL_PKCS8 = "PRIVATE KEY";

// Maximum token size accepted for parsing (64KB)
inline constexpr std::size_t MAX_TOKEN_SIZE = 64 * 1024;

} // namespace tokenauth
