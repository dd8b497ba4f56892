#include <gtest/gtest.h>

#include "Codec.hpp"

TEST(CodecTest, Base64EncodesWithPadding)
{
    EXPECT_EQ(Codec::Base64Encode(""), "");
    EXPECT_EQ(Codec::Base64Encode("f"), "Zg==");
    EXPECT_EQ(Codec::Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Codec::Base64Encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(Codec::Base64Encode("test.mp4"), "dGVzdC5tcDQ=");
}

TEST(CodecTest, Base64HandlesBinaryAndLongInput)
{
    const std::string binary("\x00\xff\x10", 3);
    EXPECT_EQ(Codec::Base64Encode(binary), "AP8Q");

    const std::string encoded = Codec::Base64Encode(std::string(100, 'x'));
    EXPECT_EQ(encoded.size(), 136u);
    EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

TEST(CodecTest, RandomHexHasRequestedLength)
{
    auto [ok, first, err] = Codec::RandomHex(16);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(first.size(), 32u);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);

    auto [ok2, second, err2] = Codec::RandomHex(16);
    ASSERT_TRUE(ok2) << err2.message;
    EXPECT_NE(first, second);
}

TEST(CodecTest, Base64KeepsHighBitBytes)
{
    EXPECT_EQ(Codec::Base64Encode("\xff\xfe\xfd"), "//79");
    EXPECT_EQ(Codec::Base64Encode("\xc3\xa9t\xc3\xa9.mp4"), "w6l0w6kubXA0");
}
