#include "base64url.hpp"
#include <stdexcept>
#include <array>

namespace tokenauth {
namespace internal {

namespace {
    constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    constexpr std::uint8_t INVALID = 0xFF;

    // Maps ASCII value to 6-bit value, INVALID outside the alphabet
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = INVALID;

        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(alphabet[i])] = i;
        }
        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    std::uint32_t sextet(char c) {
        std::uint8_t v = decode_lookup[static_cast<std::uint8_t>(c)];
        if (v == INVALID) {
            throw std::invalid_argument("Invalid Base64 URL character in input");
        }
        return v;
    }
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                               (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(alphabet[(triple >> 18) & 0x3F]);
        result.push_back(alphabet[(triple >> 12) & 0x3F]);
        result.push_back(alphabet[(triple >> 6) & 0x3F]);
        result.push_back(alphabet[triple & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        std::uint32_t bits = static_cast<std::uint32_t>(data[i]) << 16;
        result.push_back(alphabet[(bits >> 18) & 0x3F]);
        result.push_back(alphabet[(bits >> 12) & 0x3F]);
    } else if (rest == 2) {
        std::uint32_t bits = (static_cast<std::uint32_t>(data[i]) << 16) |
                             (static_cast<std::uint32_t>(data[i + 1]) << 8);
        result.push_back(alphabet[(bits >> 18) & 0x3F]);
        result.push_back(alphabet[(bits >> 12) & 0x3F]);
        result.push_back(alphabet[(bits >> 6) & 0x3F]);
    }

    return result;
}

std::string base64url_encode(std::string_view text) {
    return base64url_encode(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    if (input.size() % 4 == 1) {
        throw std::invalid_argument("Invalid Base64 URL input length");
    }

    std::vector<std::uint8_t> result;
    result.reserve((input.size() * 3) / 4);

    std::size_t i = 0;
    for (; i + 3 < input.size(); i += 4) {
        std::uint32_t quad = (sextet(input[i]) << 18) |
                             (sextet(input[i + 1]) << 12) |
                             (sextet(input[i + 2]) << 6) |
                              sextet(input[i + 3]);

        result.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        result.push_back(static_cast<std::uint8_t>(quad & 0xFF));
    }

    const std::size_t rest = input.size() - i;
    if (rest == 2) {
        std::uint32_t bits = (sextet(input[i]) << 18) | (sextet(input[i + 1]) << 12);
        if (bits & 0xFFFF) {
            throw std::invalid_argument("Non-zero trailing bits in Base64 URL input");
        }
        result.push_back(static_cast<std::uint8_t>((bits >> 16) & 0xFF));
    } else if (rest == 3) {
        std::uint32_t bits = (sextet(input[i]) << 18) |
                             (sextet(input[i + 1]) << 12) |
                             (sextet(input[i + 2]) << 6);
        if (bits & 0xFF) {
            throw std::invalid_argument("Non-zero trailing bits in Base64 URL input");
        }
        result.push_back(static_cast<std::uint8_t>((bits >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((bits >> 8) & 0xFF));
    }

    return result;
}

std::string base64url_decode_string(std::string_view input) {
    auto bytes = base64url_decode(input);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace internal
} // namespace tokenauth
