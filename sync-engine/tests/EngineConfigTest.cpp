/**
 * @file EngineConfigTest.cpp
 * @brief
 */

// Standard Library Includes
#include <chrono>
#include <fstream>
#include <string>
#include <vector>

// Third Party Library Includes
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/EngineConfig.hpp>
#include <bsdmirrors/sync_engine/Errors.hpp>

#include "TestSupport.hpp"

// System Includes
#include <stdlib.h>

namespace bsdmirrors::sync_engine
{
namespace
{
auto mirrors_json() -> nlohmann::json
{
    return nlohmann::json::parse(R"({
        "engine": {
            "database": "/var/lib/sync-engine/state.db",
            "rsync_executable": "/usr/local/bin/rsync",
            "rsync_options": ["-a", "--delete"],
            "tick_seconds": 5,
            "termination_grace_seconds": 10,
            "output_limit_bytes": 4096
        },
        "mirrors": {
            "freebsd": {
                "upstream": "rsync://ftp.freebsd.org/FreeBSD/",
                "dest": "/storage/freebsd"
            },
            "netbsd": {
                "kind": "netbsd",
                "upstream": "rsync://ftp.netbsd.org/pub/NetBSD/",
                "dest": "/storage/netbsd",
                "enabled": false,
                "password_file": "/etc/sync-engine/netbsd.secret"
            }
        }
    })");
}

// Sets an environment variable for the lifetime of the guard
class ScopedEnvironment
{
  public:
    ScopedEnvironment(const char* name, const char* value)
        : m_Name(name)
    {
        ::setenv(name, value, 1);
    }

    ScopedEnvironment(ScopedEnvironment&) = delete;
    ScopedEnvironment(ScopedEnvironment&&) = delete;
    auto operator=(ScopedEnvironment&) -> ScopedEnvironment& = delete;
    auto operator=(ScopedEnvironment&&) -> ScopedEnvironment& = delete;

    ~ScopedEnvironment()
    {
        ::unsetenv(m_Name);
    }

  private:
    const char* m_Name;
};
} // namespace

TEST(EngineConfig, ReadsEngineAndMirrors)
{
    const auto config = EngineConfig::from_json(mirrors_json());

    EXPECT_EQ(config.database.string(), "/var/lib/sync-engine/state.db");
    EXPECT_EQ(config.executor.transfer.executable.string(), "/usr/local/bin/rsync");
    EXPECT_EQ(config.executor.transfer.options, (std::vector<std::string> { "-a", "--delete" }));
    EXPECT_EQ(config.tickInterval, std::chrono::seconds(5));
    EXPECT_EQ(config.executor.terminationGrace, std::chrono::seconds(10));
    EXPECT_EQ(config.executor.outputLimitBytes, 4096U);

    ASSERT_EQ(config.mirrors.size(), 2U);

    const auto& freebsd = config.mirrors.at(0);
    EXPECT_EQ(freebsd.name, "freebsd");
    EXPECT_EQ(freebsd.kind, "freebsd");
    EXPECT_EQ(freebsd.upstreamUrl, "rsync://ftp.freebsd.org/FreeBSD/");
    EXPECT_EQ(freebsd.localPath, "/storage/freebsd");
    EXPECT_TRUE(freebsd.enabled);
    EXPECT_FALSE(freebsd.passwordFile.has_value());

    const auto& netbsd = config.mirrors.at(1);
    EXPECT_FALSE(netbsd.enabled);
    EXPECT_EQ(netbsd.passwordFile, "/etc/sync-engine/netbsd.secret");
}

TEST(EngineConfig, EngineBlockIsOptional)
{
    auto json = mirrors_json();
    json.erase("engine");

    const auto config = EngineConfig::from_json(json);

    EXPECT_EQ(config.database.string(), "data/sync-engine.db");
    EXPECT_EQ(config.executor.transfer.executable.string(), "/usr/bin/rsync");
    EXPECT_EQ(config.tickInterval, std::chrono::seconds(10));
    EXPECT_EQ(config.executor.terminationGrace, std::chrono::seconds(30));
    EXPECT_EQ(config.executor.outputLimitBytes, 10000U);
    EXPECT_EQ(config.controlPort, "9281");
}

TEST(EngineConfig, InvalidMirrorsAreSkipped)
{
    auto json = mirrors_json();
    json["mirrors"]["broken"]  = { { "dest", "/storage/broken" } };
    json["mirrors"]["ftponly"] = { { "upstream", "ftp://ftp.example.org/" }, { "dest", "/x" } };

    const auto config = EngineConfig::from_json(json);

    EXPECT_EQ(config.mirrors.size(), 2U);
}

TEST(EngineConfig, NoMirrorsIsAnError)
{
    EXPECT_THROW((void)EngineConfig::from_json(nlohmann::json::object()), config_error);
    EXPECT_THROW(
        (void)EngineConfig::from_json(nlohmann::json { { "mirrors", nlohmann::json::object() } }),
        config_error
    );

    const auto onlyBroken = nlohmann::json::parse(
        R"({"mirrors": {"broken": {"dest": "/storage/broken"}}})"
    );
    EXPECT_THROW((void)EngineConfig::from_json(onlyBroken), config_error);
}

TEST(EngineConfig, EngineValuesMustBePositive)
{
    auto json                      = mirrors_json();
    json["engine"]["tick_seconds"] = 0;
    EXPECT_THROW((void)EngineConfig::from_json(json), config_error);

    json                                 = mirrors_json();
    json["engine"]["output_limit_bytes"] = -1;
    EXPECT_THROW((void)EngineConfig::from_json(json), config_error);

    json                           = mirrors_json();
    json["engine"]["tick_seconds"] = "ten";
    EXPECT_THROW((void)EngineConfig::from_json(json), config_error);
}

TEST(EngineConfig, LoadsFromAFile)
{
    const test_support::TemporaryDirectory directory;
    const auto file = directory.path() / "mirrors.json";

    {
        std::ofstream stream(file);
        stream << mirrors_json().dump(4);
    }

    EXPECT_EQ(EngineConfig::load(file).mirrors.size(), 2U);
}

TEST(EngineConfig, LoadFailures)
{
    const test_support::TemporaryDirectory directory;

    EXPECT_THROW((void)EngineConfig::load(directory.path() / "missing.json"), config_error);

    const auto file = directory.path() / "broken.json";
    {
        std::ofstream stream(file);
        stream << "{ \"mirrors\": ";
    }
    EXPECT_THROW((void)EngineConfig::load(file), config_error);
}

TEST(EngineConfig, EnvironmentOverrides)
{
    const ScopedEnvironment dryRun("DRY_RUN", "True");
    const ScopedEnvironment port("MANUAL_SYNC_PORT", "9999");
    const ScopedEnvironment database("SYNC_DATABASE", "/tmp/override.db");
    const ScopedEnvironment schedule("SYNC_SCHEDULE", "0 */6 * * *");
    const ScopedEnvironment startup("SYNC_ON_STARTUP", "yes");

    auto config = EngineConfig::from_json(mirrors_json());
    config.apply_environment();

    EXPECT_TRUE(config.executor.dryRun);
    EXPECT_EQ(config.controlPort, "9999");
    EXPECT_EQ(config.database.string(), "/tmp/override.db");
    EXPECT_EQ(config.settingSeeds.at("sync_schedule"), "0 */6 * * *");
    EXPECT_EQ(config.settingSeeds.at("sync_on_startup"), "yes");
    EXPECT_FALSE(config.settingSeeds.contains("sync_timeout"));
}

TEST(EngineConfig, DryRunDefaultsToFalse)
{
    ::unsetenv("DRY_RUN");

    auto config = EngineConfig::from_json(mirrors_json());
    config.apply_environment();

    EXPECT_FALSE(config.executor.dryRun);
}
} // namespace bsdmirrors::sync_engine
