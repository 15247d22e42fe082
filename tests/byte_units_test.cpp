#include "core/ByteUnits.hpp"

#include <gtest/gtest.h>

using chunkdrop::core::formatBytes;

TEST(ByteUnits, SmallCountsInBytes)
{
    EXPECT_EQ("0 Bytes", formatBytes(0));
    EXPECT_EQ("1 Byte", formatBytes(1));
    EXPECT_EQ("1023 Bytes", formatBytes(1023));
}

TEST(ByteUnits, LargerCountsWithTwoDecimals)
{
    EXPECT_EQ("1.00 KB", formatBytes(1024));
    EXPECT_EQ("1.50 KB", formatBytes(1536));
    EXPECT_EQ("90.00 MB", formatBytes(90ULL * 1024 * 1024));
    EXPECT_EQ("3.00 GB", formatBytes(3ULL * 1024 * 1024 * 1024));
    EXPECT_EQ("2.00 TB", formatBytes(2ULL * 1024 * 1024 * 1024 * 1024));
}
