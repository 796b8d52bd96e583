#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tokenauth::tool {

// trim whitespace (both ends)
inline std::string trim(std::string s) {
    auto isspace = [](unsigned char c){ return std::isspace(c); };
    auto b = std::find_if_not(s.begin(), s.end(), isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    if (b >= e) return {};
    return {b, e};
}

/// Command line of tokenauth-tool: --key value, --key=value, -k value,
/// bare flags (stored as "true") and positional arguments
struct ToolArgs {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    static ToolArgs parse(int argc, char* argv[]) {
        ToolArgs result;

        // A following argument is a value unless it looks like an option
        auto takesValue = [&](int i) {
            return i + 1 < argc && std::string_view(argv[i + 1]).rfind('-', 0) != 0;
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--") {
                for (++i; i < argc; ++i) result.positional.push_back(argv[i]);
                break;
            }

            std::string key;
            if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
                key = arg.substr(2);
            } else if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
                key = arg.substr(1);
            } else {
                result.positional.push_back(trim(arg));
                continue;
            }

            if (auto eq = key.find('='); eq != std::string::npos) {
                std::string val = trim(key.substr(eq + 1));
                result.options[trim(key.substr(0, eq))] = val.empty() ? "true" : val;
            } else if (takesValue(i)) {
                result.options[trim(key)] = trim(argv[++i]);
            } else {
                result.options[trim(key)] = "true";
            }
        }

        return result;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        if (const auto it = options.find(std::string(key)); it != options.end()) return it->second;
        return std::nullopt;
    }

    [[nodiscard]] bool has(std::string_view key) const {
        return options.count(std::string(key)) != 0;
    }

    [[nodiscard]] std::string require(std::string_view key) const {
        auto value = get(key);
        if (!value || *value == "true") {
            throw std::runtime_error("--" + std::string(key) + " <value> required");
        }
        return *value;
    }

    [[nodiscard]] std::int64_t getInt(std::string_view key, std::int64_t fallback) const {
        auto value = get(key);
        if (!value) return fallback;
        try {
            std::size_t used = 0;
            std::int64_t parsed = std::stoll(*value, &used);
            if (used != value->size()) throw std::invalid_argument(*value);
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error("--" + std::string(key) + " expects an integer, got '" + *value + "'");
        }
    }
};

}
