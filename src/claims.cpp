#include "tokenauth/claims.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>
#include <string>

namespace tokenauth {

namespace {
    template<typename T>
    void readOptional(const nlohmann::json& j, const char* key, T& out) {
        if (auto it = j.find(key); it != j.end() && !it->is_null()) {
            out = it->get<T>();
        }
    }

    // NumericDate claims must be JSON integers that fit in 64 signed bits
    void readTimestamp(const nlohmann::json& j, const char* key, std::int64_t& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return;
        }
        if (it->is_number_unsigned()) {
            if (it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw std::invalid_argument(std::string("claim '") + key + "' is out of range");
            }
        } else if (!it->is_number_integer()) {
            throw std::invalid_argument(std::string("claim '") + key + "' must be an integer");
        }
        out = it->get<std::int64_t>();
    }
}

void to_json(nlohmann::json& j, const Addon& addon) {
    j = nlohmann::json{{"name", addon.name}, {"enabled", addon.enabled}};
}

void from_json(const nlohmann::json& j, Addon& addon) {
    j.at("name").get_to(addon.name);
    readOptional(j, "enabled", addon.enabled);
}

void to_json(nlohmann::json& j, const Claims& claims) {
    j = nlohmann::json::object();

    if (!claims.id.empty()) j["jti"] = claims.id;
    if (!claims.subject.empty()) j["sub"] = claims.subject;
    if (!claims.issuer.empty()) j["iss"] = claims.issuer;
    if (!claims.audience.empty()) j["aud"] = claims.audience;
    if (claims.issuedAt != 0) j["iat"] = claims.issuedAt;
    if (claims.expiresAt != 0) j["exp"] = claims.expiresAt;
    if (claims.notBefore != 0) j["nbf"] = claims.notBefore;

    if (!claims.tenant.empty()) j["tenant"] = claims.tenant;
    if (!claims.scope.empty()) j["scp"] = claims.scope;
    if (claims.user) j["user"] = true;
    if (!claims.plan.empty()) j["plan"] = claims.plan;
    if (claims.trial) j["trial"] = true;
    if (!claims.addons.empty()) j["addons"] = claims.addons;
}

void from_json(const nlohmann::json& j, Claims& claims) {
    claims = Claims{};

    readOptional(j, "jti", claims.id);
    readOptional(j, "sub", claims.subject);
    readOptional(j, "iss", claims.issuer);
    readOptional(j, "aud", claims.audience);
    readTimestamp(j, "iat", claims.issuedAt);
    readTimestamp(j, "exp", claims.expiresAt);
    readTimestamp(j, "nbf", claims.notBefore);

    readOptional(j, "tenant", claims.tenant);
    readOptional(j, "scp", claims.scope);
    readOptional(j, "user", claims.user);
    readOptional(j, "plan", claims.plan);
    readOptional(j, "trial", claims.trial);
    readOptional(j, "addons", claims.addons);
}

}
