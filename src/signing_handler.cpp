#include "signing_handler.hpp"
#include "tokenauth/constants.hpp"
#include "base64url.hpp"
#include "token_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tokenauth::internal {

namespace {
    TokenResult reject(const std::string& reason) {
        spdlog::debug("Rejected token: {}", reason);
        return TokenResult::failure(TokenError::Invalid);
    }
}

SigningHandler::SigningHandler(EvpPkeyPtr key, int keyId, ValidationOptions opts)
    : key_(std::move(key)), keyId_(keyId), opts_(std::move(opts)) {
    if (!key_) {
        throw std::invalid_argument("Signing key cannot be null");
    }
}

std::string SigningHandler::toJWT(const Claims& claims) const {
    if (claims.subject.empty()) {
        throw std::invalid_argument("Token subject cannot be empty");
    }
    if (claims.expiresAt <= 0) {
        throw std::invalid_argument("Token expiration must be set");
    }
    if (claims.issuedAt > 0 && claims.expiresAt < claims.issuedAt) {
        throw std::invalid_argument("Expiration must not be before issuedAt");
    }

    nlohmann::json payload = claims;
    if (claims.id.empty()) {
        payload["jti"] = generateJti();
    }

    std::string signing_input = base64url_encode(createHeader(algorithm(), keyId_)) + "." +
                                base64url_encode(payload.dump());

    auto signature = sign(signing_input);
    return signing_input + "." + base64url_encode(signature);
}

TokenResult SigningHandler::fromJWT(const std::string& token) const {
    try {
        auto parts = parseToken(token);

        auto header = decodeJsonSegment(parts.header_b64);
        auto alg = header.find("alg");
        if (alg == header.end() || !alg->is_string() || alg->get<std::string>() != algorithm()) {
            return reject("unexpected signing algorithm");
        }
        if (auto typ = header.find("typ");
            typ != header.end() && (!typ->is_string() || typ->get<std::string>() != JWT_TYPE)) {
            return reject("unexpected token type");
        }

        auto signature = base64url_decode(parts.signature_b64);
        if (!verify(parts.signing_input, signature)) {
            return reject("signature verification failed");
        }

        auto claims = decodeJsonSegment(parts.payload_b64).get<Claims>();

        if (auto result = validate(claims, opts_); !result) {
            spdlog::debug("Rejected token: {}", result.reason);
            return TokenResult::failure(result.error.value_or(TokenError::Invalid));
        }

        return TokenResult::success(Token{std::move(claims), keyId_});

    } catch (const std::exception& e) {
        return reject(e.what());
    }
}

}
