/**
 * @file Serialization.hpp
 * @brief JSON views of engine records for the control socket
 */

#pragma once

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>
#include <bsdmirrors/sync_engine/SyncJob.hpp>

namespace bsdmirrors::sync_engine
{
// Timestamps are ISO 8601 strings in UTC; absent values are null
auto to_json(nlohmann::json& json, const MirrorTarget& target) -> void;
auto to_json(nlohmann::json& json, const SyncJob& job) -> void;
auto to_json(nlohmann::json& json, const Setting& setting) -> void;
} // namespace bsdmirrors::sync_engine
