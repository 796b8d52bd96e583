#include "signing_handler.hpp"
#include "tokenauth/constants.hpp"
#include <openssl/err.h>
#include <stdexcept>

namespace tokenauth::internal {

std::string RS256Handler::algorithm() const {
    return ALG_RS256;
}

std::vector<std::uint8_t> RS256Handler::sign(std::string_view input) const {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key()) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), input.data(), input.size()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("RS256 signing failed to initialize");
    }

    std::size_t length = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &length) != 1) {
        ERR_clear_error();
        throw std::runtime_error("RS256 signing failed");
    }

    std::vector<std::uint8_t> signature(length);
    if (EVP_DigestSignFinal(ctx.get(), signature.data(), &length) != 1) {
        ERR_clear_error();
        throw std::runtime_error("RS256 signing failed");
    }
    signature.resize(length);
    return signature;
}

bool RS256Handler::verify(std::string_view input, std::span<const std::uint8_t> signature) const {
    if (signature.size() != static_cast<std::size_t>(EVP_PKEY_size(key()))) {
        return false;
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    bool valid = ctx &&
        EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key()) == 1 &&
        EVP_DigestVerifyUpdate(ctx.get(), input.data(), input.size()) == 1 &&
        EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;

    // Failed verifications leave entries on the thread's error queue
    ERR_clear_error();
    return valid;
}

}
