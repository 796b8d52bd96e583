#include <gtest/gtest.h>
#include "../src/base64url.hpp"
#include <stdexcept>
#include <string>

using tokenauth::internal::base64url_decode;
using tokenauth::internal::base64url_decode_string;
using tokenauth::internal::base64url_encode;

TEST(Base64UrlTest, EncodesRfc4648Vectors) {
    EXPECT_EQ(base64url_encode(std::string_view("")), "");
    EXPECT_EQ(base64url_encode(std::string_view("f")), "Zg");
    EXPECT_EQ(base64url_encode(std::string_view("fo")), "Zm8");
    EXPECT_EQ(base64url_encode(std::string_view("foo")), "Zm9v");
    EXPECT_EQ(base64url_encode(std::string_view("foob")), "Zm9vYg");
    EXPECT_EQ(base64url_encode(std::string_view("fooba")), "Zm9vYmE");
    EXPECT_EQ(base64url_encode(std::string_view("foobar")), "Zm9vYmFy");
}

TEST(Base64UrlTest, UsesUrlSafeAlphabet) {
    const std::uint8_t bytes[] = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64url_encode(std::span<const std::uint8_t>(bytes)), "-_-_");

    auto decoded = base64url_decode("-_-_");
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[0], 0xFB);
    EXPECT_EQ(decoded[1], 0xFF);
    EXPECT_EQ(decoded[2], 0xBF);
}

TEST(Base64UrlTest, DecodesJwtHeader) {
    EXPECT_EQ(base64url_decode_string("eyJhbGciOiJSUzI1NiJ9"), R"({"alg":"RS256"})");
}

TEST(Base64UrlTest, RejectsPadding) {
    EXPECT_THROW(base64url_decode("Zg=="), std::invalid_argument);
}

TEST(Base64UrlTest, RejectsStandardAlphabet) {
    EXPECT_THROW(base64url_decode("+/+/"), std::invalid_argument);
}

TEST(Base64UrlTest, RejectsImpossibleLength) {
    EXPECT_THROW(base64url_decode("Zm9vY"), std::invalid_argument);
}

TEST(Base64UrlTest, RejectsNonZeroTrailingBits) {
    // "Zg" is canonical for "f"; "Zh" carries extra bits
    EXPECT_NO_THROW(base64url_decode("Zg"));
    EXPECT_THROW(base64url_decode("Zh"), std::invalid_argument);
    EXPECT_THROW(base64url_decode("Zm9"), std::invalid_argument);
}

TEST(Base64UrlTest, EmptyInputDecodesToNothing) {
    EXPECT_TRUE(base64url_decode("").empty());
}
