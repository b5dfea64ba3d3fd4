/**
 * @file SchedulerTest.cpp
 * @brief
 */

// Standard Library Includes
#include <chrono>
#include <optional>
#include <utility>

// Third Party Library Includes
#include <gtest/gtest.h>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/JobExecutor.hpp>
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/Scheduler.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>

#include "TestSupport.hpp"

namespace bsdmirrors::sync_engine
{
namespace
{
using namespace std::chrono;

auto at(const year_month_day date, const hours hour, const minutes minute)
    -> system_clock::time_point
{
    return sys_days { date } + hour + minute;
}

class SchedulerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto& root = m_Directory.path();

        using test_support::definition;

        m_FreeBSD = m_Registry.register_target(definition("freebsd", root / "freebsd")).id;
        m_NetBSD  = m_Registry.register_target(definition("netbsd", root / "netbsd")).id;
        m_OpenBSD
            = m_Registry.register_target(definition("openbsd", root / "openbsd", false)).id;
    }

    // Dry runs by default so scheduled jobs finish without a transfer
    auto build(ExecutorOptions options = ExecutorOptions { .dryRun = true })
        -> Scheduler&
    {
        m_Executor.emplace(m_Registry, m_History, m_Settings, std::move(options));
        m_Scheduler.emplace(
            m_Registry,
            m_Locks,
            m_History,
            m_Settings,
            *m_Executor,
            milliseconds(20)
        );

        return *m_Scheduler;
    }

    auto wait_for_idle() -> bool
    {
        return test_support::wait_until(
            [this]()
            {
                return m_Scheduler->running_jobs() == 0 && !m_Locks.is_locked(m_FreeBSD)
                    && !m_Locks.is_locked(m_NetBSD);
            }
        );
    }

    test_support::TemporaryDirectory m_Directory;
    Database                         m_Database { ":memory:" };
    SettingsStore                    m_Settings { m_Database };
    MirrorRegistry                   m_Registry { m_Database };
    MirrorLockManager                m_Locks { m_Registry };
    JobHistoryStore                  m_History { m_Database };
    std::optional<JobExecutor>       m_Executor;
    std::optional<Scheduler>         m_Scheduler;
    TargetId                         m_FreeBSD = 0;
    TargetId                         m_NetBSD  = 0;
    TargetId                         m_OpenBSD = 0;
};
} // namespace

TEST_F(SchedulerTest, FiresEnabledTargetsAtTheScheduledMinute)
{
    auto& scheduler = this->build();

    scheduler.tick(at(2024y / January / 1d, 3h, 58min));
    scheduler.tick(at(2024y / January / 1d, 3h, 59min));
    EXPECT_TRUE(m_History.list_recent(10).empty());

    scheduler.tick(at(2024y / January / 1d, 4h, 0min));
    ASSERT_TRUE(this->wait_for_idle());

    const auto jobs = m_History.list_recent(10);
    ASSERT_EQ(jobs.size(), 2U);
    for (const auto& job : jobs)
    {
        EXPECT_NE(job.targetId, m_OpenBSD);
        EXPECT_EQ(job.trigger, TriggerOrigin::schedule());
        EXPECT_EQ(job.status, JobStatus::COMPLETED);
    }

    // Not again until tomorrow
    scheduler.tick(at(2024y / January / 1d, 4h, 1min));
    scheduler.tick(at(2024y / January / 1d, 23h, 59min));
    EXPECT_EQ(m_History.list_recent(10).size(), 2U);

    scheduler.tick(at(2024y / January / 2d, 4h, 0min));
    ASSERT_TRUE(this->wait_for_idle());
    EXPECT_EQ(m_History.list_recent(10).size(), 4U);
}

TEST_F(SchedulerTest, MissedFireRunsOnTheNextTick)
{
    auto& scheduler = this->build();

    scheduler.tick(at(2024y / January / 1d, 3h, 0min));
    // The loop was held up well past 04:00
    scheduler.tick(at(2024y / January / 1d, 4h, 17min));
    ASSERT_TRUE(this->wait_for_idle());

    EXPECT_EQ(m_History.list_recent(10).size(), 2U);
}

TEST_F(SchedulerTest, BusyTargetSkipsItsTurn)
{
    auto& scheduler = this->build();

    scheduler.tick(at(2024y / January / 1d, 3h, 0min));

    ASSERT_TRUE(m_Locks.try_acquire(m_FreeBSD));
    scheduler.tick(at(2024y / January / 1d, 4h, 0min));
    ASSERT_TRUE(
        test_support::wait_until([this]() { return m_Scheduler->running_jobs() == 0; })
    );

    const auto jobs = m_History.list_recent(10);
    ASSERT_EQ(jobs.size(), 1U);
    EXPECT_EQ(jobs.front().targetId, m_NetBSD);

    (void)m_Locks.release(
        m_FreeBSD,
        SyncOutcome { .succeeded = true, .finishedAt = now() }
    );

    // The missed fire is not replayed
    scheduler.tick(at(2024y / January / 1d, 4h, 1min));
    ASSERT_TRUE(this->wait_for_idle());
    EXPECT_EQ(m_History.list(m_FreeBSD, 10).size(), 0U);
}

TEST_F(SchedulerTest, SyncOnStartupFiresOnTheFirstTickOnly)
{
    (void)m_Settings.set(setting_keys::SYNC_ON_STARTUP, "true");
    auto& scheduler = this->build();

    scheduler.tick(at(2024y / January / 1d, 12h, 0min));
    ASSERT_TRUE(this->wait_for_idle());
    EXPECT_EQ(m_History.list_recent(10).size(), 2U);

    scheduler.tick(at(2024y / January / 1d, 12h, 1min));
    ASSERT_TRUE(this->wait_for_idle());
    EXPECT_EQ(m_History.list_recent(10).size(), 2U);
}

TEST_F(SchedulerTest, ScheduleChangesTakeEffectOnTheNextTick)
{
    auto& scheduler = this->build();

    scheduler.tick(at(2024y / January / 1d, 3h, 0min));
    (void)m_Settings.set(setting_keys::SYNC_SCHEDULE, "30 3 * * *");

    // Recomputed from the new expression; 03:30 has not come yet
    scheduler.tick(at(2024y / January / 1d, 3h, 10min));
    EXPECT_TRUE(m_History.list_recent(10).empty());

    scheduler.tick(at(2024y / January / 1d, 3h, 30min));
    ASSERT_TRUE(this->wait_for_idle());
    EXPECT_EQ(m_History.list_recent(10).size(), 2U);
}

TEST_F(SchedulerTest, DispatchRejectsBusyDisabledAndUnknownTargets)
{
    auto& scheduler = this->build();

    ASSERT_TRUE(m_Locks.try_acquire(m_FreeBSD));

    const auto alice = TriggerOrigin::manual("alice");

    EXPECT_THROW((void)scheduler.dispatch(m_FreeBSD, alice), target_busy);
    EXPECT_THROW((void)scheduler.dispatch(m_OpenBSD, alice), target_disabled);
    EXPECT_THROW((void)scheduler.dispatch(m_OpenBSD + 100, alice), target_not_found);

    // None of the rejected requests left a job behind
    EXPECT_TRUE(m_History.list_recent(10).empty());
}

TEST_F(SchedulerTest, StopInterruptsRunningJobs)
{
    const auto script = test_support::write_script(m_Directory.path(), "rsync", "sleep 30");
    auto& scheduler = this->build(
        ExecutorOptions { .transfer = { .executable = script, .options = {} },
                          .terminationGrace = seconds(1) }
    );

    const auto job = scheduler.dispatch(m_FreeBSD, TriggerOrigin::manual("alice"));
    ASSERT_TRUE(test_support::wait_until(
        [this, &job]() { return m_History.get(job.id).status == JobStatus::RUNNING; }
    ));
    EXPECT_EQ(scheduler.running_jobs(), 1U);

    scheduler.stop();

    const auto stored = m_History.get(job.id);
    EXPECT_EQ(stored.status, JobStatus::FAILED);
    EXPECT_EQ(stored.failureKind, FailureKind::INTERRUPTED);
    EXPECT_FALSE(m_Locks.is_locked(m_FreeBSD));
    EXPECT_EQ(m_Registry.get_target(m_FreeBSD).status, TargetStatus::ERROR);

    EXPECT_THROW(
        (void)scheduler.dispatch(m_NetBSD, TriggerOrigin::manual("alice")),
        precondition_violation
    );
}

TEST_F(SchedulerTest, LoopRunsUntilStopped)
{
    (void)m_Settings.set(setting_keys::SYNC_ON_STARTUP, "true");
    auto& scheduler = this->build();

    scheduler.start();
    ASSERT_TRUE(test_support::wait_until(
        [this]() { return m_History.list_recent(10).size() == 2U; }
    ));
    ASSERT_TRUE(this->wait_for_idle());
    scheduler.stop();

    for (const auto& job : m_History.list_recent(10))
    {
        EXPECT_EQ(job.status, JobStatus::COMPLETED);
    }
}
} // namespace bsdmirrors::sync_engine
