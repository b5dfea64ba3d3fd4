/**
 * @file MirrorTarget.hpp
 * @brief One upstream distribution tree mirrored to local storage
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Project Includes
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
using TargetId = std::int64_t;

enum class TargetStatus : std::uint8_t
{
    ACTIVE,
    SYNCING,
    ERROR,
    DISABLED,
};

[[nodiscard]]
auto to_string(TargetStatus status) -> std::string_view;

// Throws `database_error` for an unknown name
[[nodiscard]]
auto target_status_from_string(std::string_view status) -> TargetStatus;

struct MirrorTarget
{
    TargetId                    id = 0;
    std::string                 name;
    std::string                 kind;
    std::string                 upstreamUrl;
    std::string                 localPath;
    std::optional<std::string>  passwordFile;
    bool                        enabled = true;
    TargetStatus                status  = TargetStatus::ACTIVE;
    std::optional<Timestamp>    lastSyncStarted;
    std::optional<Timestamp>    lastSyncCompleted;
    std::optional<std::string>  lastSyncError;
    std::optional<std::int64_t> totalSizeBytes;
    std::optional<std::int64_t> fileCount;
};

// Administrative edit. Unset fields are left alone.
struct TargetUpdate
{
    std::optional<std::string> upstreamUrl;
    std::optional<bool>        enabled;
};
} // namespace bsdmirrors::sync_engine
