#pragma once
#include "tokenauth/claims.hpp"
#include "tokenauth/constants.hpp"

namespace tokenauth {

/// A verified token: its claims plus the identifier of the key that verified it
struct Token {
    Claims claims;
    int keyId = KEY_ID_ZERO;
};

} // namespace tokenauth
