#include <gtest/gtest.h>
#include "base64.h"
#include <string>
#include <vector>

using namespace sharebox;

namespace {
std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}
}

TEST(Base64Test, EncodeKnownVectors) {
    EXPECT_EQ(base64::encode(bytes("")), "");
    EXPECT_EQ(base64::encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64::encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64::encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64::encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodeKnownVectors) {
    std::vector<uint8_t> out;
    
    ASSERT_TRUE(base64::decode("Zm9vYmFy", out));
    EXPECT_EQ(out, bytes("foobar"));
    
    ASSERT_TRUE(base64::decode("Zm8=", out));
    EXPECT_EQ(out, bytes("fo"));
    
    ASSERT_TRUE(base64::decode("", out));
    EXPECT_TRUE(out.empty());
}

TEST(Base64Test, BinaryDataSurvives) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    
    std::vector<uint8_t> decoded;
    ASSERT_TRUE(base64::decode(base64::encode(data), decoded));
    EXPECT_EQ(decoded, data);
}

TEST(Base64Test, MissingPaddingIsAccepted) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64::decode("Zg", out));
    EXPECT_EQ(out, bytes("f"));
}

TEST(Base64Test, WhitespaceIsIgnored) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64::decode("Zm9v\nYmFy\r\n", out));
    EXPECT_EQ(out, bytes("foobar"));
}

TEST(Base64Test, InvalidInputIsRejected) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(base64::decode("Zm9v*mFy", out));
    EXPECT_FALSE(base64::decode("Z", out));
    EXPECT_FALSE(base64::decode("Zg==Zg==", out));
    EXPECT_FALSE(base64::decode("not base64!", out));
}
