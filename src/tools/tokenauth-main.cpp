#include "tokenauth/tokenauth.hpp"
#include "tool_args.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

using tokenauth::tool::ToolArgs;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return tokenauth::tool::trim(buffer.str());
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

void printUsage() {
    std::cerr << R"(tokenauth-tool - identity token utility

Usage: tokenauth-tool [command] [options]

Commands:
    --sign                Issue a token signed with a private key
    --verify <token>      Verify a token and print its claims
    --kid <token>         Print the key id declared in a token header

Options:
    --version, -v         Show version
    --help, -h            Show this help
    --verbose             Debug logging
    --key <file>          PEM private key (RSA PKCS#1/PKCS#8 or Ed25519 PKCS#8)
    --pattern <regex>     Key file name pattern, first group is the key id
    --sub <id>            Subject (sign)
    --iss <issuer>        Issuer (sign)
    --aud <audience>      Audience (sign)
    --tenant <id>         Tenant (sign)
    --scope <scope>       Scope (sign)
    --plan <plan>         Plan (sign)
    --user                Mark the subject as a user (sign)
    --trial               Mark the tenant as on trial (sign)
    --ttl <seconds>       Lifetime, default 3600 (sign)
    --leeway <seconds>    Clock skew tolerance (verify)
    --out <file>          Output file (default: stdout)

A <token> argument may also be the path of a file holding the token.

Examples:
    tokenauth-tool --sign --key private.id.7.pem --sub user-1 --tenant t1
    tokenauth-tool --verify --key private.id.7.pem token.jwt
    tokenauth-tool --kid token.jwt
)";
}

std::string tokenArgument(const ToolArgs& args, const std::string& command) {
    std::string value;
    if (auto v = args.get(command); v && *v != "true") {
        value = *v;
    } else if (!args.positional.empty()) {
        value = args.positional[0];
    } else {
        throw std::runtime_error("Token string or file required");
    }

    std::ifstream probe(value);
    return probe ? readFile(value) : value;
}

std::unique_ptr<tokenauth::Handler> loadHandler(const ToolArgs& args,
                                                const tokenauth::ValidationOptions& opts = {}) {
    std::string pattern = args.get("pattern").value_or(tokenauth::DEFAULT_KEY_FILENAME_PATTERN);
    return tokenauth::newHandler(args.require("key"), pattern, opts);
}

void signCommand(const ToolArgs& args) {
    auto handler = loadHandler(args);

    using namespace std::chrono;
    const std::int64_t now = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

    tokenauth::Claims claims;
    claims.subject = args.require("sub");
    claims.issuer = args.get("iss").value_or("");
    claims.audience = args.get("aud").value_or("");
    claims.tenant = args.get("tenant").value_or("");
    claims.scope = args.get("scope").value_or("");
    claims.plan = args.get("plan").value_or("");
    claims.user = args.has("user");
    claims.trial = args.has("trial");
    claims.issuedAt = now;
    claims.expiresAt = now + args.getInt("ttl", 3600);

    std::string token = handler->toJWT(claims);

    if (auto out = args.get("out")) {
        writeFile(*out, token + "\n");
        std::cerr << "Token written to: " << *out << "\n";
    } else {
        std::cout << token << "\n";
    }
}

int verifyCommand(const ToolArgs& args) {
    auto opts = tokenauth::ValidationOptions::lenient(args.getInt("leeway", 0));
    auto handler = loadHandler(args, opts);
    std::string token = tokenArgument(args, "verify");

    auto result = handler->fromJWT(token);
    if (!result) {
        std::cerr << "✗ " << tokenauth::toString(result.error().value_or(tokenauth::TokenError::Invalid)) << "\n";
        return 1;
    }

    nlohmann::json output = result.token().claims;
    output["kid"] = result.token().keyId;
    std::cout << output.dump(2) << "\n";
    return 0;
}

void kidCommand(const ToolArgs& args) {
    std::string token = tokenArgument(args, "kid");
    std::cout << tokenauth::getKeyId(token) << "\n";
}

}

int main(int argc, char* argv[]) {
    try {
        auto args = ToolArgs::parse(argc, argv);

        spdlog::set_level(args.has("verbose") ? spdlog::level::debug : spdlog::level::warn);

        if (args.has("version") || args.has("v")) {
            std::cout << "tokenauth-tool version 1.0.0\n";
            return 0;
        }

        if (args.has("help") || args.has("h") || argc == 1) {
            printUsage();
            return 0;
        }

        if (args.has("sign")) {
            signCommand(args);
        } else if (args.has("verify")) {
            return verifyCommand(args);
        } else if (args.has("kid")) {
            kidCommand(args);
        } else {
            std::cerr << "No command specified. Use --help for usage.\n";
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
