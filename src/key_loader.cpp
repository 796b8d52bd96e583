#include "tokenauth/key_loader.hpp"
#include "tokenauth/constants.hpp"
#include "tokenauth/errors.hpp"
#include "tokenauth/key_id.hpp"
#include "signing_handler.hpp"
#include "openssl_ptr.hpp"
#include <openssl/err.h>
#include <openssl/pem.h>
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>
#include <limits>
#include <sstream>

namespace tokenauth {

namespace {
    using namespace internal;

    using HandlerFactory = std::unique_ptr<Handler> (*)(EvpPkeyPtr, int, const ValidationOptions&);

    template<typename H>
    std::unique_ptr<Handler> makeHandler(EvpPkeyPtr key, int keyId, const ValidationOptions& opts) {
        return std::make_unique<H>(std::move(key), keyId, opts);
    }

    /// One entry per supported private key algorithm
    struct KeyVariant {
        int pkeyId;
        KeyType type;
        const char* name;
        HandlerFactory create;
    };

    const std::array<KeyVariant, 2> keyVariants{{
        {EVP_PKEY_RSA, KeyType::RSA, "RSA", &makeHandler<RS256Handler>},
        {EVP_PKEY_ED25519, KeyType::Ed25519, "Ed25519", &makeHandler<Ed25519Handler>},
    }};

    struct LoadedKey {
        EvpPkeyPtr pkey;
        const KeyVariant* variant;
    };

    [[noreturn]] void fail(const std::string& message, const std::string& source) {
        ERR_clear_error();
        spdlog::error("{} ({})", message, source);
        throw KeyLoadError(message + ": " + source);
    }

    std::string readKeyFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            fail("failed to read private key", path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            fail("failed to read private key", path);
        }
        return buffer.str();
    }

    EvpPkeyPtr parsePkcs1(const unsigned char* data, long length) {
        return EvpPkeyPtr(d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &data, length));
    }

    EvpPkeyPtr parsePkcs8(const unsigned char* data, long length) {
        Pkcs8Ptr info(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &data, length));
        if (!info) {
            return nullptr;
        }
        return EvpPkeyPtr(EVP_PKCS82PKEY(info.get()));
    }

    // Decode the first PEM block and dispatch on its label
    LoadedKey loadPrivateKey(const std::string& pem, const std::string& source) {
        if (pem.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            fail("failed to read private key", source);
        }
        BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) {
            fail("failed to read private key", source);
        }

        char* rawName = nullptr;
        char* rawHeader = nullptr;
        unsigned char* rawData = nullptr;
        long length = 0;
        if (PEM_read_bio(bio.get(), &rawName, &rawHeader, &rawData, &length) != 1) {
            fail("failed to read private key", source);
        }
        OpensslPtr<char> name(rawName);
        OpensslPtr<char> header(rawHeader);
        OpensslPtr<unsigned char> data(rawData);

        const std::string label(name.get());
        EvpPkeyPtr pkey;
        if (label == PEM_LABEL_PKCS1) {
            pkey = parsePkcs1(data.get(), length);
            OPENSSL_cleanse(data.get(), static_cast<std::size_t>(length));
            if (!pkey) {
                fail("failed to read rsa private key", source);
            }
        } else if (label == PEM_LABEL_PKCS8) {
            pkey = parsePkcs8(data.get(), length);
            OPENSSL_cleanse(data.get(), static_cast<std::size_t>(length));
            if (!pkey) {
                fail("failed to read private key", source);
            }
        } else {
            fail("unsupported server private key type", source);
        }

        const int pkeyId = EVP_PKEY_base_id(pkey.get());
        for (const auto& variant : keyVariants) {
            if (variant.pkeyId == pkeyId) {
                return LoadedKey{std::move(pkey), &variant};
            }
        }
        fail("unsupported server private key type", source);
    }
}

std::unique_ptr<Handler> newHandler(const std::string& privateKeyPath,
                                    const std::string& filenamePattern,
                                    const ValidationOptions& opts) {
    std::string pem = readKeyFile(privateKeyPath);
    auto loaded = loadPrivateKey(pem, privateKeyPath);
    OPENSSL_cleanse(pem.data(), pem.size());

    const int keyId = keyIdFromPath(privateKeyPath, filenamePattern);
    spdlog::info("Loaded {} private key {} (kid {})", loaded.variant->name, privateKeyPath, keyId);

    return loaded.variant->create(std::move(loaded.pkey), keyId, opts);
}

std::unique_ptr<Handler> newHandlerFromPem(const std::string& pem, int keyId,
                                           const ValidationOptions& opts) {
    auto loaded = loadPrivateKey(pem, "<memory>");
    spdlog::debug("Loaded {} private key from memory (kid {})", loaded.variant->name, keyId);
    return loaded.variant->create(std::move(loaded.pkey), keyId, opts);
}

KeyType detectKeyType(const std::string& pem) {
    return loadPrivateKey(pem, "<memory>").variant->type;
}

}
