/**
 * @file SyncEngineTest.cpp
 * @brief
 */

// Standard Library Includes
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

// Third Party Library Includes
#include <gtest/gtest.h>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/EngineConfig.hpp>
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/SyncEngine.hpp>

#include "TestSupport.hpp"

namespace bsdmirrors::sync_engine
{
namespace
{
// Records its arguments, then holds the transfer open until `go` exists
constexpr std::string_view GATED_RSYNC = R"sh(dir="$(dirname "$0")"
echo "$@" >> "$dir/args"
while [ ! -f "$dir/go" ]; do sleep 0.05; done)sh";

class SyncEngineTest : public ::testing::Test
{
  protected:
    [[nodiscard]]
    auto config(std::string_view rsyncBody = GATED_RSYNC) const -> EngineConfig
    {
        const auto& root = m_Directory.path();

        EngineConfig config;
        config.database     = ":memory:";
        config.tickInterval = std::chrono::milliseconds(50);
        config.executor.transfer.executable
            = test_support::write_script(root, "rsync", rsyncBody);
        config.executor.transfer.options = {};
        config.executor.terminationGrace = std::chrono::seconds(1);
        config.mirrors                   = {
            test_support::definition("freebsd", root / "freebsd"),
            test_support::definition("netbsd", root / "netbsd"),
        };

        return config;
    }

    auto open_gate() const -> void
    {
        std::ofstream go(m_Directory.path() / "go");
    }

    static auto id_of(const SyncEngine& engine, std::string_view name) -> TargetId
    {
        return engine.find_target(name)->id;
    }

    static auto wait_for_status(
        const SyncEngine& engine,
        const JobId       id,
        const JobStatus   status
    ) -> bool
    {
        return test_support::wait_until([&engine, id, status]()
                                        { return engine.get_job(id).status == status; });
    }

    test_support::TemporaryDirectory m_Directory;
};
} // namespace

TEST_F(SyncEngineTest, StartupSyncsConfiguredMirrors)
{
    auto config = this->config(std::format("{}\nexit 0", test_support::RSYNC_SUMMARY));
    config.settingSeeds.emplace("sync_on_startup", "true");

    SyncEngine engine(std::move(config));
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");

    ASSERT_TRUE(test_support::wait_until(
        [&engine, freebsd]()
        {
            const auto jobs = engine.list_jobs(freebsd, 10);
            return jobs.size() == 1 && jobs.front().status == JobStatus::COMPLETED;
        }
    ));
    ASSERT_TRUE(test_support::wait_until([&engine]() { return engine.running_jobs() == 0; }));

    const auto job = engine.list_jobs(freebsd, 10).front();
    EXPECT_EQ(job.trigger, TriggerOrigin::schedule());
    EXPECT_EQ(job.filesTransferred, 12);

    const auto target = engine.get_target(freebsd);
    EXPECT_EQ(target.status, TargetStatus::ACTIVE);
    EXPECT_TRUE(target.lastSyncCompleted.has_value());
    EXPECT_EQ(target.totalSizeBytes, 52428800);
    EXPECT_EQ(target.fileCount, 1200);

    engine.stop();
}

TEST_F(SyncEngineTest, BusyTriggerCreatesNoJob)
{
    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");

    const auto job = engine.trigger_sync(freebsd, "alice");
    EXPECT_EQ(job.trigger, TriggerOrigin::manual("alice"));
    ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::RUNNING));
    EXPECT_EQ(engine.get_target(freebsd).status, TargetStatus::SYNCING);

    EXPECT_THROW((void)engine.trigger_sync(freebsd, "bob"), target_busy);
    EXPECT_EQ(engine.list_jobs(freebsd, 10).size(), 1U);

    this->open_gate();
    ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::COMPLETED));

    engine.stop();
}

TEST_F(SyncEngineTest, ConcurrentTriggersHaveOneWinner)
{
    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");

    std::atomic<int> started { 0 };
    std::atomic<int> busy { 0 };
    {
        std::vector<std::jthread> operators;
        for (int i = 0; i < 8; ++i)
        {
            operators.emplace_back(
                [&engine, &started, &busy, freebsd, i]()
                {
                    try
                    {
                        (void)engine.trigger_sync(freebsd, std::format("operator{}", i));
                        ++started;
                    }
                    catch (target_busy&)
                    {
                        ++busy;
                    }
                }
            );
        }
    }

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(busy.load(), 7);
    EXPECT_EQ(engine.list_jobs(freebsd, 10).size(), 1U);

    this->open_gate();
    ASSERT_TRUE(test_support::wait_until([&engine]() { return engine.running_jobs() == 0; }));

    engine.stop();
}

TEST_F(SyncEngineTest, SettingsChangesApplyToTheNextJob)
{
    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");

    const auto first = engine.trigger_sync(freebsd, "alice");
    ASSERT_TRUE(wait_for_status(engine, first.id, JobStatus::RUNNING));

    (void)engine.update_settings({ { "sync_bandwidth_limit", "512" } });

    this->open_gate();
    ASSERT_TRUE(wait_for_status(engine, first.id, JobStatus::COMPLETED));
    ASSERT_TRUE(test_support::wait_until([&engine]() { return engine.running_jobs() == 0; }));

    const auto second = engine.trigger_sync(freebsd, "alice");
    ASSERT_TRUE(wait_for_status(engine, second.id, JobStatus::COMPLETED));

    const auto args = test_support::read_file(m_Directory.path() / "args");
    const auto firstLine = args.substr(0, args.find('\n'));
    const auto secondLine = args.substr(args.find('\n') + 1);

    EXPECT_EQ(firstLine.find("--bwlimit"), std::string::npos);
    EXPECT_TRUE(secondLine.starts_with("--partial --bwlimit=512 "));

    engine.stop();
}

TEST_F(SyncEngineTest, UpstreamCannotChangeMidSync)
{
    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");
    const auto job     = engine.trigger_sync(freebsd, "alice");
    ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::RUNNING));

    EXPECT_THROW(
        (void)engine.update_target(
            freebsd,
            TargetUpdate { .upstreamUrl = "rsync://mirror.example.net/FreeBSD/" }
        ),
        target_busy
    );
    EXPECT_THROW(engine.remove_target(freebsd), target_busy);

    // Disabling is allowed and settles once the sync ends
    const auto disabled
        = engine.update_target(freebsd, TargetUpdate { .enabled = false });
    EXPECT_FALSE(disabled.enabled);
    EXPECT_EQ(disabled.status, TargetStatus::SYNCING);

    this->open_gate();
    ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::COMPLETED));
    ASSERT_TRUE(test_support::wait_until([&engine]() { return engine.running_jobs() == 0; }));

    EXPECT_EQ(engine.get_target(freebsd).status, TargetStatus::DISABLED);
    EXPECT_THROW((void)engine.trigger_sync(freebsd, "alice"), target_disabled);

    const auto moved = engine.update_target(
        freebsd,
        TargetUpdate { .upstreamUrl = "rsync://mirror.example.net/FreeBSD/" }
    );
    EXPECT_EQ(moved.upstreamUrl, "rsync://mirror.example.net/FreeBSD/");

    engine.remove_target(freebsd);
    EXPECT_FALSE(engine.find_target("freebsd").has_value());

    engine.stop();
}

TEST_F(SyncEngineTest, ManualTriggerNeedsAnActor)
{
    SyncEngine engine(this->config());
    engine.start();

    EXPECT_THROW((void)engine.trigger_sync(id_of(engine, "freebsd"), ""), validation_error);
    EXPECT_TRUE(engine.list_recent_jobs(10).empty());

    engine.stop();
}

TEST_F(SyncEngineTest, StopInterruptsRunningSyncs)
{
    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");
    const auto job     = engine.trigger_sync(freebsd, "alice");
    ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::RUNNING));

    engine.stop();

    const auto stored = engine.get_job(job.id);
    EXPECT_EQ(stored.status, JobStatus::FAILED);
    EXPECT_EQ(stored.failureKind, FailureKind::INTERRUPTED);
    EXPECT_EQ(engine.get_target(freebsd).status, TargetStatus::ERROR);
}

TEST_F(SyncEngineTest, RestartRecoversInterruptedState)
{
    const auto database = m_Directory.path() / "engine.db";

    JobId stale = 0;
    {
        Database          db(database);
        MirrorRegistry    registry(db);
        MirrorLockManager locks(registry);
        JobHistoryStore   history(db);

        const auto target = registry.register_target(
            test_support::definition("freebsd", m_Directory.path() / "freebsd")
        );

        // Simulates a process that died mid-sync
        ASSERT_TRUE(locks.try_acquire(target.id));
        auto job   = history.append(target.id, TriggerOrigin::schedule());
        job.status = JobStatus::RUNNING;
        history.record(job);
        stale = job.id;
    }

    auto config     = this->config();
    config.database = database;

    SyncEngine engine(std::move(config));
    engine.start();

    const auto target = engine.get_target(id_of(engine, "freebsd"));
    EXPECT_EQ(target.status, TargetStatus::ERROR);
    EXPECT_EQ(target.lastSyncError, "sync interrupted by engine restart");

    const auto job = engine.get_job(stale);
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(job.failureKind, FailureKind::INTERRUPTED);

    // And the target can sync again
    this->open_gate();
    const auto fresh = engine.trigger_sync(target.id, "alice");
    EXPECT_TRUE(wait_for_status(engine, fresh.id, JobStatus::COMPLETED));

    engine.stop();
}

TEST_F(SyncEngineTest, PruneHistory)
{
    this->open_gate();

    SyncEngine engine(this->config());
    engine.start();

    const auto freebsd = id_of(engine, "freebsd");

    for (int i = 0; i < 3; ++i)
    {
        const auto job = engine.trigger_sync(freebsd, "alice");
        ASSERT_TRUE(wait_for_status(engine, job.id, JobStatus::COMPLETED));
        ASSERT_TRUE(
            test_support::wait_until([&engine]() { return engine.running_jobs() == 0; })
        );
    }

    EXPECT_EQ(engine.prune_history(RetentionPolicy { .keepPerTarget = 1 }), 2U);
    EXPECT_EQ(engine.list_jobs(freebsd, 10).size(), 1U);

    engine.stop();
}
} // namespace bsdmirrors::sync_engine
