#pragma once

#include "tokenauth/claims.hpp"
#include "tokenauth/errors.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace tokenauth {

/**
 * Outcome of a claims check: success, or the error kind with a reason.
 * The reason is for logging only, callers see the kind.
 */
struct ValidationResult {
    bool valid;
    std::optional<TokenError> error;
    std::string reason;

    explicit operator bool() const { return valid; }

    static ValidationResult success() {
        return ValidationResult{true, std::nullopt, {}};
    }

    static ValidationResult failure(TokenError kind, std::string reason) {
        return ValidationResult{false, kind, std::move(reason)};
    }
};

/**
 * Options for configuring token verification
 */
struct ValidationOptions {
    bool checkExpiration = true;        // Reject tokens past 'exp'
    bool checkNotBefore = true;         // Reject tokens before 'nbf'
    std::int64_t clockSkewSeconds = 0;  // Leeway applied to exp and nbf, negative means 0

    // Current Unix time in seconds; the system clock when empty
    std::function<std::int64_t()> clock;

    [[nodiscard]] std::int64_t now() const;

    static ValidationOptions strict() {
        return ValidationOptions{};
    }

    static ValidationOptions lenient(std::int64_t skewSeconds) {
        ValidationOptions opts;
        opts.clockSkewSeconds = skewSeconds;
        return opts;
    }
};

/**
 * Check that the claims a verifier relies on are present (sub, exp)
 * @param claims The claims to validate
 * @return Invalid on a missing claim
 */
ValidationResult validateRequired(const Claims& claims);

/**
 * Check if the token has expired
 * @param claims The claims to validate
 * @param now Verification time (Unix seconds)
 * @param clockSkewSeconds Clock skew tolerance in seconds
 * @return Expired when now is past exp + skew
 */
ValidationResult validateExpiration(const Claims& claims, std::int64_t now,
                                    std::int64_t clockSkewSeconds = 0);

/**
 * Check if the token is not yet valid (nbf)
 * @return Invalid when now is before nbf - skew
 */
ValidationResult validateNotBefore(const Claims& claims, std::int64_t now,
                                   std::int64_t clockSkewSeconds = 0);

/**
 * Full claims check in precedence order: required fields, nbf, exp
 * @param claims The claims to validate
 * @param opts Validation options
 * @return ValidationResult with the first failure found
 */
ValidationResult validate(const Claims& claims, const ValidationOptions& opts = ValidationOptions{});

}
