#pragma once

#include "tokenauth/claims.hpp"
#include "tokenauth/errors.hpp"
#include "tokenauth/token.hpp"
#include <optional>
#include <string>
#include <utility>

namespace tokenauth {

/// Result of parsing and verifying a token: a Token or a TokenError
class TokenResult {
public:
    static TokenResult success(Token token) { return TokenResult(std::move(token)); }
    static TokenResult failure(TokenError error) { return TokenResult(error); }

    explicit operator bool() const { return token_.has_value(); }

    [[nodiscard]] const Token& token() const { return token_.value(); }
    [[nodiscard]] Token& token() { return token_.value(); }
    [[nodiscard]] std::optional<TokenError> error() const { return error_; }

private:
    explicit TokenResult(Token token) : token_(std::move(token)) {}
    explicit TokenResult(TokenError error) : error_(error) {}

    std::optional<Token> token_;
    std::optional<TokenError> error_;
};

/// Token generator/verifier bound to one key
///
/// Immutable after construction and safe to share between threads.
class Handler {
public:
    virtual ~Handler() = default;

    /// Sign the claims and return the compact token
    /// @throws std::invalid_argument if the claims cannot be serialized
    [[nodiscard]] virtual std::string toJWT(const Claims& claims) const = 0;

    /// Parse a token, verify its signature and validate its claims
    /// @return the Token, or TokenError::Expired when the token is valid
    ///         but expired, or TokenError::Invalid for everything else
    [[nodiscard]] virtual TokenResult fromJWT(const std::string& token) const = 0;

    /// JWS algorithm name ("RS256" or "EdDSA")
    [[nodiscard]] virtual std::string algorithm() const = 0;

    /// Key identifier written into the header of every issued token
    [[nodiscard]] virtual int keyId() const = 0;
};

} // namespace tokenauth
