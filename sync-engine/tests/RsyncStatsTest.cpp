/**
 * @file RsyncStatsTest.cpp
 * @brief
 */

// Third Party Library Includes
#include <gtest/gtest.h>

// Project Includes
#include <bsdmirrors/sync_engine/RsyncStats.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr auto MODERN_STATS = R"(receiving incremental file list
ISO-IMAGES/14.1/CHECKSUM.SHA256

Number of files: 12,345 (reg: 11,000, dir: 1,345)
Number of created files: 3 (reg: 3)
Number of deleted files: 7 (reg: 7)
Number of regular files transferred: 42
Total file size: 1,234,567,890 bytes
Total transferred file size: 98,765 bytes
Literal data: 98,765 bytes
Matched data: 0 bytes

sent 1,234 bytes  received 99,999 bytes  20,246.60 bytes/sec
total size is 1,234,567,890  speedup is 12,195.62
)";

constexpr auto LEGACY_STATS = R"(
Number of files: 20
Number of files transferred: 2
Total file size: 4096 bytes
Total transferred file size: 512 bytes
)";
} // namespace

TEST(RsyncStats, ParsesModernSummary)
{
    const auto stats = parse_rsync_stats(MODERN_STATS);

    EXPECT_EQ(stats.totalFiles, 12345);
    EXPECT_EQ(stats.filesDeleted, 7);
    EXPECT_EQ(stats.filesTransferred, 42);
    EXPECT_EQ(stats.totalSizeBytes, 1234567890);
    EXPECT_EQ(stats.bytesTransferred, 98765);
}

TEST(RsyncStats, ParsesLegacySummary)
{
    const auto stats = parse_rsync_stats(LEGACY_STATS);

    EXPECT_EQ(stats.totalFiles, 20);
    EXPECT_EQ(stats.filesTransferred, 2);
    EXPECT_FALSE(stats.filesDeleted.has_value());
    EXPECT_EQ(stats.totalSizeBytes, 4096);
    EXPECT_EQ(stats.bytesTransferred, 512);
}

TEST(RsyncStats, MissingSummaryLeavesEverythingUnset)
{
    const auto stats = parse_rsync_stats("rsync: connection refused\n");

    EXPECT_FALSE(stats.totalFiles.has_value());
    EXPECT_FALSE(stats.filesTransferred.has_value());
    EXPECT_FALSE(stats.totalSizeBytes.has_value());
    EXPECT_FALSE(stats.bytesTransferred.has_value());
}
} // namespace bsdmirrors::sync_engine
