#include <gtest/gtest.h>
#include "tokenauth/tokenauth.hpp"
#include "../src/base64url.hpp"
#include "../src/openssl_ptr.hpp"
#include "test_keys.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

using testkeys::Format;
using tokenauth::Claims;
using tokenauth::TokenError;
using tokenauth::internal::base64url_decode_string;
using tokenauth::internal::base64url_encode;

namespace {

struct Segments {
    std::string header;
    std::string payload;
    std::string signature;
};

Segments split(const std::string& token) {
    auto first = token.find('.');
    auto second = token.find('.', first + 1);
    return {token.substr(0, first), token.substr(first + 1, second - first - 1), token.substr(second + 1)};
}

std::string join(const Segments& s) {
    return s.header + "." + s.payload + "." + s.signature;
}

// Sign "header.payload" with an Ed25519 PEM key, bypassing Handler::toJWT
std::string signEd25519(const std::string& pem, const nlohmann::json& header, const nlohmann::json& payload) {
    std::string input = base64url_encode(header.dump()) + "." + base64url_encode(payload.dump());

    tokenauth::internal::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    tokenauth::internal::EvpPkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) throw std::runtime_error("PEM_read_bio_PrivateKey failed");

    tokenauth::internal::EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    std::vector<std::uint8_t> signature(64);
    std::size_t length = signature.size();
    bool ok = ctx && EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) == 1 &&
              EVP_DigestSign(ctx.get(), signature.data(), &length,
                             reinterpret_cast<const unsigned char*>(input.data()), input.size()) == 1;
    if (!ok) throw std::runtime_error("EVP_DigestSign failed");

    return input + "." + base64url_encode(std::span<const std::uint8_t>(signature.data(), length));
}

// Replace one character with a different one from the Base64 URL alphabet
std::string flipChar(std::string text, std::size_t pos) {
    text[pos] = text[pos] == 'A' ? 'B' : 'A';
    return text;
}

Claims fullClaims(std::int64_t now) {
    Claims c;
    c.id = "5f1ba1c27a4b4e8f9d0c3b2a1e0f9d8c";
    c.subject = "user-1";
    c.issuer = "identity";
    c.audience = "api";
    c.issuedAt = now;
    c.expiresAt = now + 3600;
    c.notBefore = now;
    c.tenant = "t1";
    c.scope = "all";
    c.user = true;
    c.plan = "professional";
    c.trial = false;
    c.addons = {{"troubleshoot", true}};
    return c;
}

}

class HandlerTest : public ::testing::TestWithParam<std::pair<int, Format>> {
protected:
    static void SetUpTestSuite() {
        rsa = tokenauth::newHandlerFromPem(testkeys::generatePem(EVP_PKEY_RSA, Format::Pkcs1), 7);
        ed = tokenauth::newHandlerFromPem(testkeys::generatePem(EVP_PKEY_ED25519, Format::Pkcs8), 7);
    }

    static void TearDownTestSuite() {
        rsa.reset();
        ed.reset();
    }

    const tokenauth::Handler& handler() const {
        return GetParam().first == EVP_PKEY_RSA ? *rsa : *ed;
    }

    const tokenauth::Handler& other() const {
        return GetParam().first == EVP_PKEY_RSA ? *ed : *rsa;
    }

    static std::unique_ptr<tokenauth::Handler> rsa;
    static std::unique_ptr<tokenauth::Handler> ed;
};

std::unique_ptr<tokenauth::Handler> HandlerTest::rsa;
std::unique_ptr<tokenauth::Handler> HandlerTest::ed;

TEST_P(HandlerTest, RoundTripKeepsAllClaims) {
    auto claims = fullClaims(testkeys::now());

    auto result = handler().fromJWT(handler().toJWT(claims));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.token().claims, claims);
    EXPECT_EQ(result.token().keyId, 7);
    EXPECT_FALSE(result.error().has_value());
}

TEST_P(HandlerTest, HeaderCarriesAlgorithmAndKeyId) {
    auto token = handler().toJWT(fullClaims(testkeys::now()));
    auto header = nlohmann::json::parse(base64url_decode_string(split(token).header));

    EXPECT_EQ(header["alg"], handler().algorithm());
    EXPECT_EQ(header["kid"], 7);
    EXPECT_EQ(header["typ"], "JWT");
}

TEST_P(HandlerTest, GeneratesTokenIdWhenMissing) {
    auto claims = fullClaims(testkeys::now());
    claims.id.clear();

    auto first = handler().fromJWT(handler().toJWT(claims));
    auto second = handler().fromJWT(handler().toJWT(claims));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.token().claims.id.size(), 32u);
    EXPECT_NE(first.token().claims.id, second.token().claims.id);
}

TEST_P(HandlerTest, ExpiredTokenIsExpired) {
    auto now = testkeys::now();
    Claims claims = fullClaims(now - 7200);

    auto result = handler().fromJWT(handler().toJWT(claims));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), TokenError::Expired);
}

TEST_P(HandlerTest, TamperedSignatureIsInvalid) {
    auto token = handler().toJWT(fullClaims(testkeys::now()));
    auto parts = split(token);

    for (std::size_t pos : {std::size_t{0}, parts.signature.size() / 2, parts.signature.size() - 2}) {
        auto tampered = parts;
        tampered.signature = flipChar(parts.signature, pos);
        auto result = handler().fromJWT(join(tampered));
        EXPECT_EQ(result.error(), TokenError::Invalid) << "position " << pos;
    }
}

TEST_P(HandlerTest, TamperedPayloadIsInvalid) {
    auto token = handler().toJWT(fullClaims(testkeys::now()));
    auto parts = split(token);
    parts.payload = flipChar(parts.payload, 5);

    EXPECT_EQ(handler().fromJWT(join(parts)).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, ForgedExpiryWithoutValidSignatureIsInvalid) {
    auto claims = fullClaims(testkeys::now() - 7200);
    auto parts = split(handler().toJWT(claims));

    claims.expiresAt = testkeys::now() + 3600;
    parts.payload = base64url_encode(nlohmann::json(claims).dump());

    EXPECT_EQ(handler().fromJWT(join(parts)).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, TokenFromOtherAlgorithmIsInvalid) {
    auto token = other().toJWT(fullClaims(testkeys::now()));
    EXPECT_EQ(handler().fromJWT(token).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, SameAlgorithmDifferentKeyIsInvalid) {
    auto type = GetParam().first;
    auto stranger = tokenauth::newHandlerFromPem(testkeys::generatePem(type, Format::Pkcs8), 7);

    auto token = stranger->toJWT(fullClaims(testkeys::now()));
    EXPECT_EQ(handler().fromJWT(token).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, AlgorithmNoneIsInvalid) {
    auto parts = split(handler().toJWT(fullClaims(testkeys::now())));
    parts.header = base64url_encode(std::string_view(R"({"alg":"none","kid":7,"typ":"JWT"})"));

    EXPECT_EQ(handler().fromJWT(join(parts)).error(), TokenError::Invalid);
    EXPECT_EQ(handler().fromJWT(parts.header + "." + parts.payload + ".").error(), TokenError::Invalid);
}

TEST_P(HandlerTest, RelabelledAlgorithmIsInvalid) {
    auto parts = split(other().toJWT(fullClaims(testkeys::now())));
    nlohmann::json header = {{"alg", handler().algorithm()}, {"kid", 7}, {"typ", "JWT"}};
    parts.header = base64url_encode(header.dump());

    EXPECT_EQ(handler().fromJWT(join(parts)).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, MalformedTokensAreInvalid) {
    auto token = handler().toJWT(fullClaims(testkeys::now()));

    for (const std::string& bad : {std::string(), std::string("."), std::string(".."),
                                   std::string("not-a-token"), std::string("a.b.c"),
                                   token + ".extra", token + "=", "x" + token,
                                   std::string(tokenauth::MAX_TOKEN_SIZE + 1, 'a')}) {
        auto result = handler().fromJWT(bad);
        EXPECT_FALSE(result);
        EXPECT_EQ(result.error(), TokenError::Invalid) << bad.substr(0, 40);
    }
}

TEST_P(HandlerTest, NotYetValidIsInvalid) {
    auto claims = fullClaims(testkeys::now());
    claims.notBefore = claims.issuedAt + 600;

    EXPECT_EQ(handler().fromJWT(handler().toJWT(claims)).error(), TokenError::Invalid);
}

TEST_P(HandlerTest, SigningRejectsUnserializableClaims) {
    auto claims = fullClaims(testkeys::now());

    auto noSubject = claims;
    noSubject.subject.clear();
    EXPECT_THROW((void)handler().toJWT(noSubject), std::invalid_argument);

    auto noExpiry = claims;
    noExpiry.expiresAt = 0;
    EXPECT_THROW((void)handler().toJWT(noExpiry), std::invalid_argument);

    auto backwards = claims;
    backwards.expiresAt = claims.issuedAt - 1;
    EXPECT_THROW((void)handler().toJWT(backwards), std::invalid_argument);
}

TEST_P(HandlerTest, ConcurrentUseIsSafe) {
    const auto claims = fullClaims(testkeys::now());
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto result = handler().fromJWT(handler().toJWT(claims));
                if (!result || result.token().claims != claims) ++failures;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

INSTANTIATE_TEST_SUITE_P(Algorithms, HandlerTest,
    ::testing::Values(std::make_pair(EVP_PKEY_RSA, Format::Pkcs1),
                      std::make_pair(EVP_PKEY_ED25519, Format::Pkcs8)),
    [](const auto& info) { return info.param.first == EVP_PKEY_RSA ? std::string("RS256") : std::string("EdDSA"); });

TEST(HandlerClockTest, UsesVerificationTimeClock) {
    std::int64_t now = 1700000000;
    tokenauth::ValidationOptions opts;
    opts.clock = [&now] { return now; };

    auto handler = tokenauth::newHandlerFromPem(
        testkeys::generatePem(EVP_PKEY_ED25519, Format::Pkcs8), 1, opts);

    Claims claims;
    claims.subject = "user-1";
    claims.issuedAt = now;
    claims.expiresAt = now + 60;
    auto token = handler->toJWT(claims);

    EXPECT_TRUE(handler->fromJWT(token));
    now += 61;
    EXPECT_EQ(handler->fromJWT(token).error(), TokenError::Expired);
}

TEST(HandlerClockTest, FarFutureExpirationSurvivesClockSkew) {
    auto handler = tokenauth::newHandlerFromPem(
        testkeys::generatePem(EVP_PKEY_ED25519, Format::Pkcs8), 1, tokenauth::ValidationOptions::lenient(30));

    Claims claims;
    claims.subject = "svc";
    claims.expiresAt = std::numeric_limits<std::int64_t>::max();

    auto result = handler->fromJWT(handler->toJWT(claims));
    ASSERT_TRUE(result) << tokenauth::toString(*result.error());
    EXPECT_EQ(result.token().claims.expiresAt, claims.expiresAt);
}

class SignedPayloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        pem = testkeys::generatePem(EVP_PKEY_ED25519, Format::Pkcs8);
        handler = tokenauth::newHandlerFromPem(pem, 7);
        now = testkeys::now();
        header = {{"alg", "EdDSA"}, {"kid", 7}, {"typ", "JWT"}};
        payload = {{"sub", "user-1"}, {"iat", now}, {"exp", now + 3600}};
    }

    std::string pem;
    std::unique_ptr<tokenauth::Handler> handler;
    std::int64_t now = 0;
    nlohmann::json header;
    nlohmann::json payload;
};

TEST_F(SignedPayloadTest, ValidlySignedTokenVerifies) {
    EXPECT_TRUE(handler->fromJWT(signEd25519(pem, header, payload)));
}

TEST_F(SignedPayloadTest, HeaderWithoutTypeIsAccepted) {
    header.erase("typ");
    EXPECT_TRUE(handler->fromJWT(signEd25519(pem, header, payload)));
}

TEST_F(SignedPayloadTest, MissingSubjectIsInvalid) {
    payload.erase("sub");
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, MissingExpirationIsInvalid) {
    payload.erase("exp");
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, MissingSubjectWinsOverExpiry) {
    payload.erase("sub");
    payload["exp"] = now - 10;
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, WrongClaimTypeIsInvalid) {
    payload["exp"] = "tomorrow";
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, NonIntegerExpirationIsInvalid) {
    payload["exp"] = 1e300;
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);

    payload["exp"] = static_cast<double>(now + 3600);
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, UnexpectedTypeIsInvalid) {
    header["typ"] = "JWE";
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, payload)).error(), TokenError::Invalid);
}

TEST_F(SignedPayloadTest, NonObjectPayloadIsInvalid) {
    EXPECT_EQ(handler->fromJWT(signEd25519(pem, header, nlohmann::json::array({1, 2}))).error(),
              TokenError::Invalid);
}
