/**
 * @file RsyncStats.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/RsyncStats.hpp>

// Standard Library Includes
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bsdmirrors::sync_engine
{
namespace
{
// `Total file size: 1,234,567 bytes` -> 1234567
// `Number of files: 12,345 (reg: 11,000, dir: 1,345)` -> 12345
auto parse_leading_count(std::string_view value) -> std::optional<std::int64_t>
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }

    std::string digits;
    for (const char c : value)
    {
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            digits += c;
        }
        else if (c != ',')
        {
            break;
        }
    }

    std::int64_t count = 0;
    const auto [end, error]
        = std::from_chars(digits.data(), digits.data() + digits.size(), count);

    if (digits.empty() || error != std::errc {})
    {
        return std::nullopt;
    }

    return count;
}

auto match_counter(
    std::string_view             line,
    std::string_view             label,
    std::optional<std::int64_t>& counter
) -> bool
{
    if (!line.starts_with(label))
    {
        return false;
    }

    if (const auto count = parse_leading_count(line.substr(label.size())))
    {
        counter = count;
    }

    return true;
}
} // namespace

auto parse_rsync_stats(std::string_view output) -> RsyncStats
{
    RsyncStats stats;

    // rsync 3.1+ says "regular files"; older releases print the shorter form
    const std::array<std::pair<std::string_view, std::optional<std::int64_t>*>, 6>
        counters = { {
            { "Number of regular files transferred:", &stats.filesTransferred },
            { "Number of files transferred:", &stats.filesTransferred },
            { "Number of deleted files:", &stats.filesDeleted },
            { "Number of files:", &stats.totalFiles },
            { "Total transferred file size:", &stats.bytesTransferred },
            { "Total file size:", &stats.totalSizeBytes },
        } };

    while (!output.empty())
    {
        const auto newline = output.find('\n');
        auto       line    = output.substr(0, newline);
        output.remove_prefix(
            newline == std::string_view::npos ? output.size() : newline + 1
        );

        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())))
        {
            line.remove_prefix(1);
        }

        for (const auto& [label, counter] : counters)
        {
            if (match_counter(line, label, *counter))
            {
                break;
            }
        }
    }

    return stats;
}
} // namespace bsdmirrors::sync_engine
