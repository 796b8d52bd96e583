#include "signing_handler.hpp"
#include "tokenauth/constants.hpp"
#include <openssl/err.h>
#include <stdexcept>

namespace tokenauth::internal {

namespace {
    constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;
}

std::string Ed25519Handler::algorithm() const {
    return ALG_EDDSA;
}

std::vector<std::uint8_t> Ed25519Handler::sign(std::string_view input) const {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    // Ed25519 hashes internally, no digest is passed
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("Ed25519 signing failed to initialize");
    }

    std::vector<std::uint8_t> signature(ED25519_SIGNATURE_SIZE);
    std::size_t length = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &length,
                       reinterpret_cast<const unsigned char*>(input.data()), input.size()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("Ed25519 signing failed");
    }
    signature.resize(length);
    return signature;
}

bool Ed25519Handler::verify(std::string_view input, std::span<const std::uint8_t> signature) const {
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    bool valid = ctx &&
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key()) == 1 &&
        EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                         reinterpret_cast<const unsigned char*>(input.data()), input.size()) == 1;

    ERR_clear_error();
    return valid;
}

}
