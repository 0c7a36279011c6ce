/**
 * @file test_base64.cpp
 * @brief Unit tests for base64 encoding
 */

#include <gtest/gtest.h>
#include <pubsubd/utils/base64.hpp>

#include <string>

using namespace pubsubd::utils;

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(Base64::encode(""), "");
    EXPECT_EQ(Base64::encode("f"), "Zg==");
    EXPECT_EQ(Base64::encode("fo"), "Zm8=");
    EXPECT_EQ(Base64::encode("foo"), "Zm9v");
    EXPECT_EQ(Base64::encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesKnownVectors) {
    std::string out;
    ASSERT_TRUE(Base64::decode("Zm9vYg==", out));
    EXPECT_EQ(out, "foob");

    ASSERT_TRUE(Base64::decode("cHJvamVjdHMvcC90b3BpY3MvdA==", out));
    EXPECT_EQ(out, "projects/p/topics/t");
}

TEST(Base64Test, PreservesBinaryPayload) {
    std::string binary("\x00\xff\x10\x80", 4);
    std::string out;
    ASSERT_TRUE(Base64::decode(Base64::encode(binary), out));
    EXPECT_EQ(out, binary);
}

TEST(Base64Test, RejectsMalformedInput) {
    std::string out;
    EXPECT_FALSE(Base64::decode("abc", out));        // length not a multiple of 4
    EXPECT_FALSE(Base64::decode("ab!d", out));       // bad alphabet
    EXPECT_FALSE(Base64::decode("a=bc", out));       // padding in the middle
    EXPECT_FALSE(Base64::decode("Zg==Zg==", out));   // data after padding
}
