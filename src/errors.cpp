#include "tokenauth/errors.hpp"

namespace tokenauth {

std::string_view toString(TokenError error) noexcept {
    switch (error) {
        case TokenError::Expired: return "jwt: token expired";
        case TokenError::Invalid: return "jwt: token invalid";
    }
    return "jwt: token invalid";
}

}
