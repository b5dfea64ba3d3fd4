/**
 * @file EngineConfig.hpp
 * @brief Process configuration read from `configs/mirrors.json` and the environment
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/JobExecutor.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>

namespace bsdmirrors::sync_engine
{
struct EngineConfig
{
    std::filesystem::path         database     = "data/sync-engine.db";
    ExecutorOptions               executor;
    std::chrono::milliseconds     tickInterval = std::chrono::seconds(10);
    std::string                   controlPort  = "9281";
    std::vector<TargetDefinition> mirrors;
    // First-boot values for settings missing from the database
    SettingsStore::SettingMap     settingSeeds;

    // Throws `config_error`
    [[nodiscard]]
    static auto from_json(const nlohmann::json& config) -> EngineConfig;

    // Throws `config_error`
    [[nodiscard]]
    static auto load(const std::filesystem::path& file) -> EngineConfig;

    // DRY_RUN, MANUAL_SYNC_PORT, SYNC_DATABASE and the SYNC_* setting seeds
    auto apply_environment() -> void;
};
} // namespace bsdmirrors::sync_engine
