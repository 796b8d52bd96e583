#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tokenauth {

/// An add-on enabled (or not) for the tenant the token was issued for
struct Addon {
    std::string name;
    bool enabled = false;

    bool operator==(const Addon&) const = default;
};

/// Payload of an identity token
///
/// Timestamps are Unix seconds, 0 means the claim is absent.
struct Claims {
    std::string id;         // jti
    std::string subject;    // sub, usually a user id
    std::string issuer;     // iss
    std::string audience;   // aud
    std::int64_t issuedAt = 0;   // iat
    std::int64_t expiresAt = 0;  // exp
    std::int64_t notBefore = 0;  // nbf

    std::string tenant;
    std::string scope;      // scp
    bool user = false;
    std::string plan;
    bool trial = false;
    std::vector<Addon> addons;

    bool operator==(const Claims&) const = default;
};

/// Serialize claims to the JSON payload object (absent claims are omitted)
void to_json(nlohmann::json& j, const Claims& claims);

/// Deserialize claims from a JSON payload object
/// @throws nlohmann::json::exception if a claim has the wrong type
void from_json(const nlohmann::json& j, Claims& claims);

void to_json(nlohmann::json& j, const Addon& addon);
void from_json(const nlohmann::json& j, Addon& addon);

} // namespace tokenauth
