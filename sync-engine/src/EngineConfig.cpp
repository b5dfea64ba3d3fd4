/**
 * @file EngineConfig.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/EngineConfig.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
struct SeedVariable
{
    const char*      variable;
    std::string_view key;
};

constexpr std::array SEED_VARIABLES = {
    SeedVariable { "SYNC_SCHEDULE", setting_keys::SYNC_SCHEDULE },
    SeedVariable { "SYNC_BANDWIDTH_LIMIT", setting_keys::SYNC_BANDWIDTH_LIMIT },
    SeedVariable { "SYNC_TIMEOUT", setting_keys::SYNC_TIMEOUT },
    SeedVariable { "SYNC_ON_STARTUP", setting_keys::SYNC_ON_STARTUP },
};

auto positive_seconds(const nlohmann::json& engine, const char* key)
    -> std::chrono::seconds
{
    const auto seconds = engine.at(key).get<std::int64_t>();

    if (seconds <= 0)
    {
        throw config_error(std::format("engine.{} must be positive", key));
    }

    return std::chrono::seconds(seconds);
}

auto read_target(const std::string& name, const nlohmann::json& mirror)
    -> TargetDefinition
{
    TargetDefinition definition {
        .name        = name,
        .kind        = mirror.value("kind", name),
        .upstreamUrl = mirror.at("upstream").get<std::string>(),
        .localPath   = mirror.at("dest").get<std::string>(),
        .enabled     = mirror.value("enabled", true),
    };

    if (mirror.contains("password_file"))
    {
        definition.passwordFile = mirror.at("password_file").get<std::string>();
    }

    try
    {
        MirrorRegistry::validate_upstream_url(definition.upstreamUrl);
    }
    catch (validation_error& ve)
    {
        throw config_error(std::format("Mirror '{}': {}", name, ve.what()));
    }

    return definition;
}

auto read_engine(const nlohmann::json& engine, EngineConfig& config) -> void
{
    if (engine.contains("database"))
    {
        config.database = engine.at("database").get<std::string>();
    }

    if (engine.contains("rsync_executable"))
    {
        config.executor.transfer.executable
            = engine.at("rsync_executable").get<std::string>();
    }

    if (engine.contains("rsync_options"))
    {
        config.executor.transfer.options.clear();

        for (const std::string option : engine.at("rsync_options"))
        {
            config.executor.transfer.options.emplace_back(option);
        }
    }

    if (engine.contains("tick_seconds"))
    {
        config.tickInterval = positive_seconds(engine, "tick_seconds");
    }

    if (engine.contains("termination_grace_seconds"))
    {
        config.executor.terminationGrace
            = positive_seconds(engine, "termination_grace_seconds");
    }

    if (engine.contains("output_limit_bytes"))
    {
        const auto limit = engine.at("output_limit_bytes").get<std::int64_t>();

        if (limit <= 0)
        {
            throw config_error("engine.output_limit_bytes must be positive");
        }

        config.executor.outputLimitBytes = static_cast<std::size_t>(limit);
    }
}
} // namespace

auto EngineConfig::from_json(const nlohmann::json& config) -> EngineConfig
{
    EngineConfig engineConfig;

    try
    {
        read_engine(config.value("engine", nlohmann::json::object()), engineConfig);
    }
    catch (nlohmann::json::exception& je)
    {
        throw config_error(std::format("Invalid engine block: {}", je.what()));
    }

    const auto mirrors = config.value("mirrors", nlohmann::json::object());

    if (mirrors.empty())
    {
        throw config_error("No mirrors found in config!");
    }

    for (const auto& [name, mirrorDetails] : mirrors.items())
    {
        try
        {
            engineConfig.mirrors.emplace_back(read_target(name, mirrorDetails));
            spdlog::trace("Catalogued mirror {}", name);
        }
        catch (nlohmann::json::exception& je)
        {
            spdlog::error("Mirror '{}' is not valid: {}", name, je.what());
        }
        catch (config_error& ce)
        {
            spdlog::error(ce.what());
        }
    }

    if (engineConfig.mirrors.empty())
    {
        throw config_error("No valid mirrors found in config!");
    }

    return engineConfig;
}

auto EngineConfig::load(const std::filesystem::path& file) -> EngineConfig
{
    std::ifstream mirrorsConfigFile(file);

    if (!mirrorsConfigFile.good())
    {
        std::string errorMessage(BUFSIZ, '\0');

        throw config_error(
            std::format(
                "Failed to load config file {}! OS Error: {}",
                file.string(),
                // NOLINTNEXTLINE(*-include-cleaner)
                ::strerror_r(errno, errorMessage.data(), errorMessage.size())
            )
        );
    }

    nlohmann::json config;
    try
    {
        config = nlohmann::json::parse(mirrorsConfigFile);
    }
    catch (nlohmann::json::parse_error& pe)
    {
        throw config_error(
            std::format("Failed to parse config file {}: {}", file.string(), pe.what())
        );
    }

    return EngineConfig::from_json(config);
}

auto EngineConfig::apply_environment() -> void
{
    // NOLINTBEGIN(*-mt-unsafe)
    if (const auto* dryRunPtr = std::getenv("DRY_RUN"))
    {
        std::string dryRun(dryRunPtr);
        std::transform(
            std::begin(dryRun),
            std::end(dryRun),
            std::begin(dryRun),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); }
        );

        executor.dryRun = (dryRun == "TRUE");
    }
    else
    {
        spdlog::warn(
            "Key \"DRY_RUN\" not set in the environment. Defaulting to false."
        );
        executor.dryRun = false;
    }

    if (const auto* port = std::getenv("MANUAL_SYNC_PORT"))
    {
        controlPort = port;
    }

    if (const auto* databasePath = std::getenv("SYNC_DATABASE"))
    {
        database = databasePath;
    }

    for (const auto& [variable, key] : SEED_VARIABLES)
    {
        if (const auto* value = std::getenv(variable))
        {
            spdlog::debug("Seeding {} from {}", key, variable);
            settingSeeds.insert_or_assign(std::string(key), value);
        }
    }
    // NOLINTEND(*-mt-unsafe)
}
} // namespace bsdmirrors::sync_engine
