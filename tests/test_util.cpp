/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, query encoding, multipart bodies, .env loading.

#include "util.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace product_sync;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:4000/game-passes/v1");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "4000");
    EXPECT_EQ(parts.target, "/game-passes/v1");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://apis.roblox.com/developer-products/v2/universes/1");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "apis.roblox.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/developer-products/v2/universes/1");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://example.com");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, QueryStringIsPartOfTarget) {
    auto parts = parseUrl("https://apis.roblox.com/v1/items?pageSize=10&pageToken=abc");
    EXPECT_EQ(parts.target, "/v1/items?pageSize=10&pageToken=abc");
}

TEST(ParseUrl, QueryWithoutPathGetsLeadingSlash) {
    auto parts = parseUrl("http://example.com:8080?x=1");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.target, "/?x=1");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:4000/v1"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/file"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///v1"), std::invalid_argument);
}

// ============================================================================
// urlEncode
// ============================================================================

TEST(UrlEncode, UnreservedCharactersPassThrough) {
    EXPECT_EQ(urlEncode("abcXYZ019-_.~"), "abcXYZ019-_.~");
}

TEST(UrlEncode, ReservedCharactersArePercentEncoded) {
    EXPECT_EQ(urlEncode("a b/c=d&e+f"), "a%20b%2Fc%3Dd%26e%2Bf");
}

TEST(UrlEncode, NonAsciiBytesAreEncodedIndividually) {
    EXPECT_EQ(urlEncode("\xC3\xA9"), "%C3%A9");
}

TEST(UrlEncode, EmptyStringStaysEmpty) {
    EXPECT_EQ(urlEncode(""), "");
}

// ============================================================================
// buildMultipartBody
// ============================================================================

TEST(MultipartBody, FieldsAreDelimitedInOrder) {
    FormFields fields = {{"name", "VIP"}, {"price", "100"}};
    const std::string body = buildMultipartBody(fields, "XyZ");

    EXPECT_EQ(body,
              "--XyZ\r\n"
              "Content-Disposition: form-data; name=\"name\"\r\n\r\n"
              "VIP\r\n"
              "--XyZ\r\n"
              "Content-Disposition: form-data; name=\"price\"\r\n\r\n"
              "100\r\n"
              "--XyZ--\r\n");
}

TEST(MultipartBody, NoFieldsOnlyClosingDelimiter) {
    EXPECT_EQ(buildMultipartBody({}, "b"), "--b--\r\n");
}

// ============================================================================
// trim / toLower
// ============================================================================

TEST(Trim, StripsBothEnds) {
    EXPECT_EQ(trim("  \t hello world \n"), "hello world");
}

TEST(Trim, AllWhitespaceBecomesEmpty) {
    EXPECT_EQ(trim(" \t\r\n "), "");
}

TEST(ToLower, AsciiOnly) {
    EXPECT_EQ(toLower("VIP Pass 2X"), "vip pass 2x");
}

// ============================================================================
// loadDotEnv
// ============================================================================

class DotEnvTest : public ::testing::Test {
protected:
    std::filesystem::path mPath;

    void SetUp() override {
        mPath = std::filesystem::temp_directory_path() /
                ("product_sync_dotenv_" + std::to_string(::getpid()) + ".env");
        ::unsetenv("PRODUCT_SYNC_TEST_A");
        ::unsetenv("PRODUCT_SYNC_TEST_B");
        ::unsetenv("PRODUCT_SYNC_TEST_C");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(mPath, ec);
        ::unsetenv("PRODUCT_SYNC_TEST_A");
        ::unsetenv("PRODUCT_SYNC_TEST_B");
        ::unsetenv("PRODUCT_SYNC_TEST_C");
    }

    void write(const std::string& contents) {
        std::ofstream out(mPath);
        out << contents;
    }
};

TEST_F(DotEnvTest, MissingFileLoadsNothing) {
    EXPECT_EQ(loadDotEnv((mPath.string() + ".missing")), 0);
}

TEST_F(DotEnvTest, ParsesQuotesCommentsAndExport) {
    write("# comment\n"
          "PRODUCT_SYNC_TEST_A=plain\n"
          "\n"
          "export PRODUCT_SYNC_TEST_B=\"quoted value\"\n"
          "not a variable line\n");

    EXPECT_EQ(loadDotEnv(mPath.string()), 2);
    ASSERT_NE(std::getenv("PRODUCT_SYNC_TEST_A"), nullptr);
    EXPECT_STREQ(std::getenv("PRODUCT_SYNC_TEST_A"), "plain");
    ASSERT_NE(std::getenv("PRODUCT_SYNC_TEST_B"), nullptr);
    EXPECT_STREQ(std::getenv("PRODUCT_SYNC_TEST_B"), "quoted value");
}

TEST_F(DotEnvTest, ExistingVariablesAreNotOverridden) {
    ::setenv("PRODUCT_SYNC_TEST_C", "from-shell", 1);
    write("PRODUCT_SYNC_TEST_C=from-file\n");

    EXPECT_EQ(loadDotEnv(mPath.string()), 0);
    EXPECT_STREQ(std::getenv("PRODUCT_SYNC_TEST_C"), "from-shell");
}
