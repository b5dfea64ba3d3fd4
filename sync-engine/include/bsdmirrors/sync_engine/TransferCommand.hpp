/**
 * @file TransferCommand.hpp
 * @brief Composes the rsync invocation for one mirror target
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>

namespace bsdmirrors::sync_engine
{
struct TransferOptions
{
    std::filesystem::path    executable = "/usr/bin/rsync";
    std::vector<std::string> options    = {
        "-avHz",
        "--delete",
        "--delete-delay",
        "--delay-updates",
        "--partial",
        "--stats",
        "--timeout=600",
    };
};

struct TransferCommand
{
    // argv[0] is the executable
    std::vector<std::string>   arguments;
    // Exported to the child as RSYNC_PASSWORD
    std::optional<std::string> password;

    [[nodiscard]]
    auto to_string() const -> std::string;
};

// `bandwidthLimit` is in KiB/s; 0 leaves out --bwlimit. Throws `spawn_error`
// when the target's password file cannot be read.
[[nodiscard]]
auto compose_transfer_command(
    const MirrorTarget&    target,
    const TransferOptions& options,
    std::int64_t           bandwidthLimit
) -> TransferCommand;
} // namespace bsdmirrors::sync_engine
