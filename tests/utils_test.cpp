#include <ratecord/internal/utils.hpp>

#include <cctype>
#include <stdexcept>

#include <gtest/gtest.h>

namespace Ratecord {
namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

TEST(UtilsTest, UrlEncodeKeepsUnreservedCharacters) {
    EXPECT_EQ(Utils::urlEncode("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
    EXPECT_EQ(Utils::urlEncode("a b&c=d/e"), "a%20b%26c%3Dd%2Fe");
    EXPECT_EQ(Utils::urlEncode("\xF0\x9F\x91\x8D"), "%F0%9F%91%8D");
    EXPECT_EQ(Utils::urlEncode(""), "");
}

TEST(UtilsTest, QueryStringSkipsUnsetValues) {
    EXPECT_EQ(Utils::makeQueryString({}), "");
    EXPECT_EQ(Utils::makeQueryString({ { "limit", boost::none } }), "");
    EXPECT_EQ(Utils::makeQueryString({ { "before", std::string("1") },
                                       { "after",  boost::none      },
                                       { "q",      std::string("a b") } }),
              "?before=1&q=a%20b");
}

TEST(UtilsTest, Split) {
    EXPECT_EQ(Utils::split("/channels/1/messages", '/'),
              std::vector<std::string>({ "", "channels", "1", "messages" }));
    EXPECT_EQ(Utils::split("single", '/'), std::vector<std::string>({ "single" }));
    EXPECT_EQ(Utils::split("a//b/", '/'), std::vector<std::string>({ "a", "", "b", "" }));
}

TEST(UtilsTest, IsNumber) {
    EXPECT_TRUE(Utils::isNumber("80351110224678912"));
    EXPECT_FALSE(Utils::isNumber(""));
    EXPECT_FALSE(Utils::isNumber("12a"));
    EXPECT_FALSE(Utils::isNumber("@me"));
}

TEST(UtilsTest, SecondsToMilliseconds) {
    EXPECT_EQ(Utils::secondsToMilliseconds(0.3), std::chrono::milliseconds(300));
    EXPECT_EQ(Utils::secondsToMilliseconds(1.25), std::chrono::milliseconds(1250));
    EXPECT_EQ(Utils::secondsToMilliseconds(0.0), std::chrono::milliseconds(0));
    EXPECT_EQ(Utils::secondsToMilliseconds(1e300), std::chrono::hours(24));
}

TEST(UtilsTest, StringToLower) {
    EXPECT_EQ(Utils::stringToLower("X-RateLimit-Bucket"), "x-ratelimit-bucket");
}

TEST(UtilsTest, Base64) {
    EXPECT_EQ(Utils::base64Encode(bytesOf("")), "");
    EXPECT_EQ(Utils::base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(Utils::base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(Utils::base64Encode(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(Utils::base64Encode(bytesOf("foobar")), "Zm9vYmFy");
}

TEST(UtilsTest, MagicDetection) {
    std::vector<uint8_t> png { 137, 'P', 'N', 'G', 13, 10, 26, 10, 0, 0, 0, 0 };
    std::vector<uint8_t> jpeg { 0xFF, 0xD8, 0xFF, 0xE0 };
    std::vector<uint8_t> gif = bytesOf("GIF89a");

    EXPECT_TRUE(Utils::Magic::isPng(png));
    EXPECT_TRUE(Utils::Magic::isJfif(jpeg));
    EXPECT_TRUE(Utils::Magic::isGif(gif));

    EXPECT_FALSE(Utils::Magic::isPng(jpeg));
    EXPECT_FALSE(Utils::Magic::isGif(bytesOf("GIF90a")));
    EXPECT_FALSE(Utils::Magic::isJfif({ 0xFF }));
}

TEST(UtilsTest, ImageDataUri) {
    EXPECT_EQ(Utils::imageDataUri(bytesOf("GIF87a")), "data:image/gif;base64,R0lGODdh");
    EXPECT_THROW(Utils::imageDataUri(bytesOf("plain text")), std::invalid_argument);
}

TEST(UtilsTest, RandomAsciiString) {
    std::string first  = Utils::randomAsciiString(32);
    std::string second = Utils::randomAsciiString(32);

    EXPECT_EQ(first.size(), 32u);
    EXPECT_NE(first, second);
    for (char ch : first) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(ch)));
    }
}

} // namespace
} // namespace Ratecord
