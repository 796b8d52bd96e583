#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace tokenauth {

/// Thrown when a handler cannot be built from a private key file
class KeyLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The two ways a token can fail verification
enum class TokenError {
    Expired,  // signature valid, but past its expiry
    Invalid   // anything else
};

/// "jwt: token expired" / "jwt: token invalid"
[[nodiscard]] std::string_view toString(TokenError error) noexcept;

} // namespace tokenauth
