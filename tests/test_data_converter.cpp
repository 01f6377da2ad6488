#include <gtest/gtest.h>
#include "utils/DataConverter.hpp"
#include <stdexcept>

TEST(DataConverter, HexRoundTrip)
{
    std::vector<uint8_t> bytes = { 0x00, 0x7F, 0x80, 0xAB, 0xFF };
    EXPECT_EQ(DataConverter::BytesToHex(bytes), "007F80ABFF");
    EXPECT_EQ(DataConverter::HexToBytes("007f80abFF"), bytes);
}

TEST(DataConverter, HexRejectsMalformedInput)
{
    EXPECT_THROW(DataConverter::HexToBytes("ABC"), std::invalid_argument);
    EXPECT_THROW(DataConverter::HexToBytes("zz"), std::invalid_argument);
    EXPECT_TRUE(DataConverter::HexToBytes("").empty());
}

TEST(DataConverter, StringBytes)
{
    auto bytes = DataConverter::StringToBytes("rust");
    EXPECT_EQ(bytes, (std::vector<uint8_t>{ 'r', 'u', 's', 't' }));
    EXPECT_EQ(DataConverter::BytesToString(bytes), "rust");
}

TEST(DataConverter, ByteList)
{
    EXPECT_EQ(DataConverter::BytesToList(DataConverter::StringToBytes("bud")), "[98, 117, 100]");
    EXPECT_EQ(DataConverter::BytesToList({}), "[]");
}
