/**
 * @file MirrorTarget.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>

// Standard Library Includes
#include <format>
#include <string_view>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
auto to_string(const TargetStatus status) -> std::string_view
{
    switch (status)
    {
    case TargetStatus::ACTIVE:
        return "active";
    case TargetStatus::SYNCING:
        return "syncing";
    case TargetStatus::ERROR:
        return "error";
    case TargetStatus::DISABLED:
        return "disabled";
    }

    return "unknown";
}

auto target_status_from_string(std::string_view status) -> TargetStatus
{
    for (const auto candidate : { TargetStatus::ACTIVE,
                                  TargetStatus::SYNCING,
                                  TargetStatus::ERROR,
                                  TargetStatus::DISABLED })
    {
        if (to_string(candidate) == status)
        {
            return candidate;
        }
    }

    throw database_error(std::format("Unknown target status `{}`", status));
}
} // namespace bsdmirrors::sync_engine
