#include "tokenauth/validation.hpp"
#include "token_utils.hpp"
#include <algorithm>
#include <sstream>

namespace tokenauth {

namespace {
    // True when later - earlier exceeds skew; a negative skew counts as zero.
    // The gap is taken in unsigned arithmetic so extreme timestamps cannot overflow.
    bool exceedsSkew(std::int64_t later, std::int64_t earlier, std::int64_t skew) {
        if (later <= earlier) {
            return false;
        }
        const auto gap = static_cast<std::uint64_t>(later) - static_cast<std::uint64_t>(earlier);
        return gap > static_cast<std::uint64_t>(std::max<std::int64_t>(skew, 0));
    }
}

std::int64_t ValidationOptions::now() const {
    return clock ? clock() : internal::getCurrentTimestamp();
}

ValidationResult validateRequired(const Claims& claims) {
    if (claims.subject.empty()) {
        return ValidationResult::failure(TokenError::Invalid, "missing 'sub' claim");
    }
    if (claims.expiresAt <= 0) {
        return ValidationResult::failure(TokenError::Invalid, "missing 'exp' claim");
    }
    return ValidationResult::success();
}

ValidationResult validateExpiration(const Claims& claims, std::int64_t now,
                                    std::int64_t clockSkewSeconds) {
    std::int64_t exp = claims.expiresAt;

    // Absence of exp is reported by validateRequired
    if (exp <= 0) {
        return ValidationResult::success();
    }

    if (exceedsSkew(now, exp, clockSkewSeconds)) {
        std::ostringstream oss;
        oss << "token has expired (exp: " << exp << ", now: " << now << ")";
        return ValidationResult::failure(TokenError::Expired, oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateNotBefore(const Claims& claims, std::int64_t now,
                                   std::int64_t clockSkewSeconds) {
    std::int64_t nbf = claims.notBefore;

    if (nbf <= 0) {
        return ValidationResult::success();
    }

    if (exceedsSkew(nbf, now, clockSkewSeconds)) {
        std::ostringstream oss;
        oss << "token is not yet valid (nbf: " << nbf << ", now: " << now << ")";
        return ValidationResult::failure(TokenError::Invalid, oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validate(const Claims& claims, const ValidationOptions& opts) {
    if (auto result = validateRequired(claims); !result) {
        return result;
    }

    const std::int64_t now = opts.now();

    if (opts.checkNotBefore) {
        if (auto result = validateNotBefore(claims, now, opts.clockSkewSeconds); !result) {
            return result;
        }
    }

    if (opts.checkExpiration) {
        if (auto result = validateExpiration(claims, now, opts.clockSkewSeconds); !result) {
            return result;
        }
    }

    return ValidationResult::success();
}

}
