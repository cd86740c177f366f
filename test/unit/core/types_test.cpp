#include <gtest/gtest.h>
#include "tsdump/core/types.h"
#include "tsdump/core/error.h"

namespace tsdump {
namespace core {
namespace {

TEST(BytesTest, SignedDecimalRendering) {
    EXPECT_EQ(bytes_to_string({}), "[]");
    EXPECT_EQ(bytes_to_string({0x00, 0x2A}), "[0, 42]");
    EXPECT_EQ(bytes_to_string({0xF0, 0xFF, 0x80}), "[-16, -1, -128]");
}

TEST(BytesTest, HexRoundTrip) {
    Bytes bytes{0x00, 0x01, 0xAB, 0xFF};
    EXPECT_EQ(to_hex(bytes), "0001abff");
    EXPECT_EQ(from_hex("0001abff"), bytes);
    EXPECT_EQ(from_hex("0001ABFF"), bytes);
}

TEST(BytesTest, InvalidHex) {
    EXPECT_THROW(from_hex("abc"), InvalidArgumentError);
    EXPECT_THROW(from_hex("zz"), InvalidArgumentError);
}

TEST(ColumnTest, Equality) {
    Column a({0x00, 0x00}, {0x2A});
    Column b({0x00, 0x00}, {0x2A});
    Column c({0x00, 0x10}, {0x2A});
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

} // namespace
} // namespace core
} // namespace tsdump
