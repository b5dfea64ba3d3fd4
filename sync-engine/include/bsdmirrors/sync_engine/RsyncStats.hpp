/**
 * @file RsyncStats.hpp
 * @brief Counters scraped from the summary rsync prints with `--stats`
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <string_view>

namespace bsdmirrors::sync_engine
{
struct RsyncStats
{
    std::optional<std::int64_t> totalFiles;
    std::optional<std::int64_t> filesTransferred;
    std::optional<std::int64_t> filesDeleted;
    std::optional<std::int64_t> totalSizeBytes;
    std::optional<std::int64_t> bytesTransferred;
};

// Best effort: lines that are missing or unparseable leave their counter empty
[[nodiscard]]
auto parse_rsync_stats(std::string_view output) -> RsyncStats;
} // namespace bsdmirrors::sync_engine
