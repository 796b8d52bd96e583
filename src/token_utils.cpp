#include "token_utils.hpp"
#include "tokenauth/constants.hpp"
#include "base64url.hpp"
#include <openssl/rand.h>
#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tokenauth::internal {

std::string generateJti() {
    std::array<unsigned char, 16> random_bytes{};
    if (RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())) != 1) {
        throw std::runtime_error("Failed to generate random token id");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : random_bytes) {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return oss.str();
}

std::int64_t getCurrentTimestamp() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string createHeader(const std::string& algorithm, int keyId) {
    nlohmann::json header;
    header["alg"] = algorithm;
    header[KEY_ID_HEADER] = keyId;
    header["typ"] = JWT_TYPE;
    return header.dump();
}

TokenParts parseToken(std::string_view token) {
    if (token.size() > MAX_TOKEN_SIZE) {
        throw std::invalid_argument("Invalid token: exceeds maximum size");
    }

    std::size_t first_dot = token.find('.');
    if (first_dot == std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: missing first '.'");
    }

    std::size_t second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: missing second '.'");
    }

    if (token.find('.', second_dot + 1) != std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: too many parts");
    }

    TokenParts parts{
        token.substr(0, first_dot),
        token.substr(first_dot + 1, second_dot - first_dot - 1),
        token.substr(second_dot + 1),
        token.substr(0, second_dot)
    };

    if (parts.header_b64.empty() || parts.payload_b64.empty() || parts.signature_b64.empty()) {
        throw std::invalid_argument("Invalid token format: empty part");
    }

    return parts;
}

nlohmann::json decodeJsonSegment(std::string_view segment_b64) {
    auto json = nlohmann::json::parse(base64url_decode_string(segment_b64));
    if (!json.is_object()) {
        throw std::invalid_argument("Token segment is not a JSON object");
    }
    return json;
}

}
