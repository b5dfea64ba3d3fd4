/**
 * @file Timestamp.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/Timestamp.hpp>

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace bsdmirrors::sync_engine
{
auto now() -> Timestamp
{
    return std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now()
    );
}

auto to_unix_millis(const Timestamp timestamp) -> std::int64_t
{
    return timestamp.time_since_epoch().count();
}

auto from_unix_millis(const std::int64_t millis) -> Timestamp
{
    return Timestamp { std::chrono::milliseconds { millis } };
}

auto to_iso8601(const Timestamp timestamp) -> std::string
{
    return std::format("{:%FT%TZ}", timestamp);
}
} // namespace bsdmirrors::sync_engine
