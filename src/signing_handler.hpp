#pragma once

#include "tokenauth/handler.hpp"
#include "tokenauth/validation.hpp"
#include "openssl_ptr.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tokenauth::internal {

/// Compact JWS framing shared by every signature algorithm
///
/// Owns the private key; subclasses only provide the signature scheme.
class SigningHandler : public Handler {
public:
    SigningHandler(EvpPkeyPtr key, int keyId, ValidationOptions opts);

    [[nodiscard]] std::string toJWT(const Claims& claims) const override;
    [[nodiscard]] TokenResult fromJWT(const std::string& token) const override;
    [[nodiscard]] int keyId() const override { return keyId_; }

protected:
    /// Sign the "header.payload" input
    /// @throws std::runtime_error on a crypto library failure
    [[nodiscard]] virtual std::vector<std::uint8_t> sign(std::string_view input) const = 0;

    /// Check a signature over the "header.payload" input
    [[nodiscard]] virtual bool verify(std::string_view input,
                                      std::span<const std::uint8_t> signature) const = 0;

    [[nodiscard]] EVP_PKEY* key() const { return key_.get(); }

private:
    EvpPkeyPtr key_;
    int keyId_;
    ValidationOptions opts_;
};

/// RSASSA-PKCS1-v1_5 with SHA-256
class RS256Handler final : public SigningHandler {
public:
    using SigningHandler::SigningHandler;

    [[nodiscard]] std::string algorithm() const override;

protected:
    [[nodiscard]] std::vector<std::uint8_t> sign(std::string_view input) const override;
    [[nodiscard]] bool verify(std::string_view input,
                              std::span<const std::uint8_t> signature) const override;
};

/// EdDSA over Ed25519 (RFC 8037)
class Ed25519Handler final : public SigningHandler {
public:
    using SigningHandler::SigningHandler;

    [[nodiscard]] std::string algorithm() const override;

protected:
    [[nodiscard]] std::vector<std::uint8_t> sign(std::string_view input) const override;
    [[nodiscard]] bool verify(std::string_view input,
                              std::span<const std::uint8_t> signature) const override;
};

}
