/**
 * @file Timestamp.hpp
 * @brief Millisecond wall-clock timestamps as stored in the database
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <string>

namespace bsdmirrors::sync_engine
{
using Timestamp
    = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

[[nodiscard]]
auto now() -> Timestamp;

[[nodiscard]]
auto to_unix_millis(Timestamp timestamp) -> std::int64_t;

[[nodiscard]]
auto from_unix_millis(std::int64_t millis) -> Timestamp;

// `2024-01-31T04:00:00.000Z`
[[nodiscard]]
auto to_iso8601(Timestamp timestamp) -> std::string;
} // namespace bsdmirrors::sync_engine
