#include <gtest/gtest.h>
#include "srcquery/util/strings.h"

class StringsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test BeginsWith
TEST_F(StringsTest, BeginsWith_PositiveMatch) {
    EXPECT_TRUE(Strings::BeginsWith("--log-level=DEBUG", "--log-"));
    EXPECT_TRUE(Strings::BeginsWith("test", "test"));
    EXPECT_TRUE(Strings::BeginsWith("abc", ""));
}

TEST_F(StringsTest, BeginsWith_NegativeMatch) {
    EXPECT_FALSE(Strings::BeginsWith("hello world", "world"));
    EXPECT_FALSE(Strings::BeginsWith("test", "testing"));
    EXPECT_FALSE(Strings::BeginsWith("", "test"));
}

// Test ToHex
TEST_F(StringsTest, ToHex_SpaceSeparated) {
    std::vector<uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF, 0x49, 0x0A};
    EXPECT_EQ(Strings::ToHex(data), "ff ff ff ff 49 0a");
}

TEST_F(StringsTest, ToHex_Truncates) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(Strings::ToHex(data, 2), "01 02 ...");
    EXPECT_EQ(Strings::ToHex(data, 4), "01 02 03 04");
    EXPECT_EQ(Strings::ToHex({}), "");
}

// Test FromHex
TEST_F(StringsTest, FromHex_ParsesCommonForms) {
    std::vector<uint8_t> out;

    ASSERT_TRUE(Strings::FromHex("ff ff ff ff 54", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x54}));

    ASSERT_TRUE(Strings::FromHex("FFFFFFFF41\n0a0B", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x41, 0x0A, 0x0B}));

    ASSERT_TRUE(Strings::FromHex("0x6a, 0x00", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x6A, 0x00}));

    ASSERT_TRUE(Strings::FromHex("", out));
    EXPECT_TRUE(out.empty());
}

TEST_F(StringsTest, FromHex_RejectsBadInput) {
    std::vector<uint8_t> out = {0x42};

    EXPECT_FALSE(Strings::FromHex("fff", out));
    EXPECT_FALSE(Strings::FromHex("zz", out));
    EXPECT_FALSE(Strings::FromHex("f f", out));

    // Output untouched on failure
    EXPECT_EQ(out, std::vector<uint8_t>{0x42});
}

// Test HexDump
TEST_F(StringsTest, HexDump_OffsetsAndAscii) {
    std::vector<uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF, 'I', 0x11, 'd', 'e', '_', 'd', 'u', 's', 't', 0x00, 0x01, 0x02, 'x'};
    std::string dump = Strings::HexDump(data);

    EXPECT_EQ(dump.find("0000: ff ff ff ff 49 11"), 0u);
    EXPECT_NE(dump.find("....I.de_dust..."), std::string::npos);
    EXPECT_NE(dump.find("0010: 78"), std::string::npos);
    EXPECT_EQ(dump.back(), '\n');
}
