#include "tokenauth/key_id.hpp"
#include "tokenauth/constants.hpp"
#include "token_utils.hpp"
#include <charconv>
#include <cmath>
#include <filesystem>
#include <limits>
#include <regex>
#include <system_error>

namespace tokenauth {

namespace {
    std::optional<int> toKeyId(const nlohmann::json& kid) {
        constexpr auto max = std::numeric_limits<int>::max();

        // The three number types of the JSON model are exclusive
        switch (kid.type()) {
            case nlohmann::json::value_t::number_float: {
                double value = kid.get<double>();
                if (!std::isfinite(value) || value < 0 || value > max) return std::nullopt;
                return static_cast<int>(value);
            }
            case nlohmann::json::value_t::number_integer: {
                std::int64_t value = kid.get<std::int64_t>();
                if (value < 0 || value > max) return std::nullopt;
                return static_cast<int>(value);
            }
            case nlohmann::json::value_t::number_unsigned: {
                std::uint64_t value = kid.get<std::uint64_t>();
                if (value > static_cast<std::uint64_t>(max)) return std::nullopt;
                return static_cast<int>(value);
            }
            default:
                return std::nullopt;
        }
    }
}

int keyIdFromPath(const std::string& path, const std::string& pattern) {
    const std::string fileName = std::filesystem::path(path).filename().string();

    try {
        std::regex re(pattern);
        std::smatch match;
        if (!std::regex_match(fileName, match, re) || match.size() < 2) {
            return KEY_ID_ZERO;
        }

        const std::string id = match[1].str();
        int keyId = KEY_ID_ZERO;
        auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), keyId);
        if (ec != std::errc{} || end != id.data() + id.size() || keyId < 0) {
            return KEY_ID_ZERO;
        }
        return keyId;

    } catch (const std::regex_error&) {
        // An unusable pattern derives no identifier
        return KEY_ID_ZERO;
    }
}

std::optional<int> findKeyId(std::string_view token) noexcept {
    try {
        auto parts = internal::parseToken(token);
        // Only the header is read; payload and signature stay opaque
        auto header = internal::decodeJsonSegment(parts.header_b64);

        auto kid = header.find(KEY_ID_HEADER);
        if (kid == header.end()) {
            return std::nullopt;
        }
        return toKeyId(*kid);

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int getKeyId(std::string_view token) noexcept {
    return findKeyId(token).value_or(KEY_ID_ZERO);
}

}
