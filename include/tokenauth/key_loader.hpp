#pragma once

#include "tokenauth/handler.hpp"
#include "tokenauth/validation.hpp"
#include <memory>
#include <string>

namespace tokenauth {

/// Private key algorithms a handler can be built from
enum class KeyType {
    RSA,
    Ed25519
};

/// Build a handler from a PEM private key file
///
/// Accepts "RSA PRIVATE KEY" (PKCS#1) and "PRIVATE KEY" (PKCS#8, RSA or
/// Ed25519) blocks. The key identifier is derived from the file name.
///
/// @param privateKeyPath Path to the PEM file
/// @param filenamePattern Regex whose first capture group is the key id
/// @param opts Verification options of the new handler
/// @throws KeyLoadError if the file cannot be read, decoded or is of an
///         unsupported key type
[[nodiscard]] std::unique_ptr<Handler> newHandler(const std::string& privateKeyPath,
                                                  const std::string& filenamePattern,
                                                  const ValidationOptions& opts = ValidationOptions{});

/// Same as newHandler, from PEM text already in memory and an explicit key id
[[nodiscard]] std::unique_ptr<Handler> newHandlerFromPem(const std::string& pem,
                                                         int keyId,
                                                         const ValidationOptions& opts = ValidationOptions{});

/// Detect the key type of a PEM private key without building a handler
/// @throws KeyLoadError as newHandler
[[nodiscard]] KeyType detectKeyType(const std::string& pem);

} // namespace tokenauth
