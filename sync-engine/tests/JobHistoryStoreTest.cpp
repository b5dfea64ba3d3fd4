/**
 * @file JobHistoryStoreTest.cpp
 * @brief
 */

// Standard Library Includes
#include <chrono>
#include <thread>

// Third Party Library Includes
#include <gtest/gtest.h>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>

#include "TestSupport.hpp"

namespace bsdmirrors::sync_engine
{
namespace
{
class JobHistoryStoreTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        m_FreeBSD = m_Registry
                        .register_target(
                            test_support::definition("freebsd", "/storage/freebsd")
                        )
                        .id;
        m_NetBSD = m_Registry
                       .register_target(
                           test_support::definition("netbsd", "/storage/netbsd")
                       )
                       .id;
    }

    // Appends a job and drives it straight to `completed`
    auto completed_job(const TargetId target) -> SyncJob
    {
        auto job = m_History.append(target, TriggerOrigin::schedule());

        job.status      = JobStatus::COMPLETED;
        job.startedAt   = now();
        job.completedAt = now();
        job.exitCode    = 0;
        m_History.record(job);

        return job;
    }

    Database        m_Database { ":memory:" };
    MirrorRegistry  m_Registry { m_Database };
    JobHistoryStore m_History { m_Database };
    TargetId        m_FreeBSD = 0;
    TargetId        m_NetBSD  = 0;
};
} // namespace

TEST_F(JobHistoryStoreTest, AppendCreatesAPendingJob)
{
    const auto job = m_History.append(m_FreeBSD, TriggerOrigin::manual("alice"));

    EXPECT_GT(job.id, 0);
    EXPECT_EQ(job.status, JobStatus::PENDING);

    const auto stored = m_History.get(job.id);
    EXPECT_EQ(stored.targetId, m_FreeBSD);
    EXPECT_EQ(stored.status, JobStatus::PENDING);
    EXPECT_EQ(stored.trigger, TriggerOrigin::manual("alice"));
    EXPECT_EQ(stored.createdAt, job.createdAt);
    EXPECT_FALSE(stored.startedAt.has_value());
    EXPECT_TRUE(stored.output.empty());
}

TEST_F(JobHistoryStoreTest, RecordPersistsEveryField)
{
    auto job = m_History.append(m_FreeBSD, TriggerOrigin::schedule());

    job.status    = JobStatus::RUNNING;
    job.startedAt = now();
    m_History.record(job);
    EXPECT_EQ(m_History.get(job.id).status, JobStatus::RUNNING);

    job.status           = JobStatus::FAILED;
    job.completedAt      = now();
    job.exitCode         = 23;
    job.failureKind      = FailureKind::TRANSFER_FAILED;
    job.output           = "rsync error: some files could not be transferred\n";
    job.errorMessage     = "rsync exited with code 23";
    m_History.record(job);

    const auto stored = m_History.get(job.id);
    EXPECT_EQ(stored.status, JobStatus::FAILED);
    EXPECT_EQ(stored.startedAt, job.startedAt);
    EXPECT_EQ(stored.completedAt, job.completedAt);
    EXPECT_EQ(stored.exitCode, 23);
    EXPECT_EQ(stored.failureKind, FailureKind::TRANSFER_FAILED);
    EXPECT_EQ(stored.output, job.output);
    EXPECT_EQ(stored.errorMessage, "rsync exited with code 23");
}

TEST_F(JobHistoryStoreTest, FinishedJobsAreNeverRewritten)
{
    auto job = this->completed_job(m_FreeBSD);

    job.status      = JobStatus::FAILED;
    job.failureKind = FailureKind::TIMEOUT;
    EXPECT_THROW(m_History.record(job), precondition_violation);

    EXPECT_EQ(m_History.get(job.id).status, JobStatus::COMPLETED);
}

TEST_F(JobHistoryStoreTest, RunningJobsCannotGoBackToPending)
{
    auto job = m_History.append(m_FreeBSD, TriggerOrigin::schedule());
    job.status = JobStatus::RUNNING;
    m_History.record(job);

    job.status = JobStatus::PENDING;
    EXPECT_THROW(m_History.record(job), precondition_violation);
}

TEST_F(JobHistoryStoreTest, PendingJobsMayFailDirectly)
{
    auto job = m_History.append(m_FreeBSD, TriggerOrigin::schedule());

    job.status      = JobStatus::FAILED;
    job.failureKind = FailureKind::SPAWN_FAILED;
    job.completedAt = now();
    EXPECT_NO_THROW(m_History.record(job));
}

TEST_F(JobHistoryStoreTest, UnknownJobs)
{
    SyncJob job;
    job.id = 999;

    EXPECT_THROW(m_History.record(job), job_not_found);
    EXPECT_THROW((void)m_History.get(999), job_not_found);
}

TEST_F(JobHistoryStoreTest, ListsAreNewestFirstAndLimited)
{
    const auto first  = this->completed_job(m_FreeBSD);
    const auto other  = this->completed_job(m_NetBSD);
    const auto second = this->completed_job(m_FreeBSD);
    const auto third  = m_History.append(m_FreeBSD, TriggerOrigin::schedule());

    const auto freebsd = m_History.list(m_FreeBSD, 2);
    ASSERT_EQ(freebsd.size(), 2U);
    EXPECT_EQ(freebsd.at(0).id, third.id);
    EXPECT_EQ(freebsd.at(1).id, second.id);

    const auto everything = m_History.list(m_FreeBSD, 100);
    ASSERT_EQ(everything.size(), 3U);
    EXPECT_EQ(everything.at(2).id, first.id);

    const auto recent = m_History.list_recent(100);
    ASSERT_EQ(recent.size(), 4U);
    EXPECT_EQ(recent.at(0).id, third.id);
    EXPECT_EQ(recent.at(2).id, other.id);
}

TEST_F(JobHistoryStoreTest, PruneKeepsTheNewestPerTarget)
{
    for (int i = 0; i < 5; ++i)
    {
        (void)this->completed_job(m_FreeBSD);
    }
    const auto netbsd  = this->completed_job(m_NetBSD);
    const auto pending = m_History.append(m_FreeBSD, TriggerOrigin::schedule());

    const auto deleted = m_History.prune(RetentionPolicy { .keepPerTarget = 2 });

    // The pending job counts as one of the two kept for freebsd
    EXPECT_EQ(deleted, 4U);
    EXPECT_EQ(m_History.list(m_FreeBSD, 100).size(), 2U);
    EXPECT_EQ(m_History.list(m_FreeBSD, 100).front().id, pending.id);
    EXPECT_EQ(m_History.list(m_NetBSD, 100).front().id, netbsd.id);
}

TEST_F(JobHistoryStoreTest, PruneByAgeSparesUnfinishedJobs)
{
    (void)this->completed_job(m_FreeBSD);
    const auto pending = m_History.append(m_FreeBSD, TriggerOrigin::schedule());

    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    const auto deleted
        = m_History.prune(RetentionPolicy { .maxAge = std::chrono::hours(0) });

    EXPECT_EQ(deleted, 1U);

    const auto remaining = m_History.list(m_FreeBSD, 100);
    ASSERT_EQ(remaining.size(), 1U);
    EXPECT_EQ(remaining.front().id, pending.id);
}

TEST_F(JobHistoryStoreTest, EmptyPolicyPrunesNothing)
{
    (void)this->completed_job(m_FreeBSD);

    EXPECT_EQ(m_History.prune(RetentionPolicy {}), 0U);
}

TEST_F(JobHistoryStoreTest, InterruptedJobsAreFailed)
{
    auto running = m_History.append(m_FreeBSD, TriggerOrigin::schedule());
    running.status = JobStatus::RUNNING;
    m_History.record(running);
    const auto pending  = m_History.append(m_NetBSD, TriggerOrigin::schedule());
    const auto finished = this->completed_job(m_FreeBSD);

    EXPECT_EQ(m_History.fail_interrupted("sync interrupted by engine restart"), 2U);

    for (const auto id : { running.id, pending.id })
    {
        const auto job = m_History.get(id);
        EXPECT_EQ(job.status, JobStatus::FAILED);
        EXPECT_EQ(job.failureKind, FailureKind::INTERRUPTED);
        EXPECT_EQ(job.errorMessage, "sync interrupted by engine restart");
        EXPECT_TRUE(job.completedAt.has_value());
    }

    EXPECT_EQ(m_History.get(finished.id).status, JobStatus::COMPLETED);
}

TEST_F(JobHistoryStoreTest, RemovingATargetRemovesItsJobs)
{
    const auto job = this->completed_job(m_FreeBSD);

    m_Registry.remove_target(m_FreeBSD);

    EXPECT_THROW((void)m_History.get(job.id), job_not_found);
}
} // namespace bsdmirrors::sync_engine
