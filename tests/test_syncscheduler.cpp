#include <gtest/gtest.h>

#include <QEventLoop>
#include <QMutex>
#include <QTimer>

#include "backend/sync/syncscheduler.h"
#include "fakes/fakemediacatalog.h"
#include "testsupport.h"

namespace Encore {
namespace {

using Testing::TempDatabase;
using Testing::fixedTime;

TEST(SyncSchedulerPolicyTest, NoPreviousSyncMeansFullSync)
{
    EXPECT_TRUE(SyncScheduler::shouldRunFullSync(QDateTime(), fixedTime()));
}

TEST(SyncSchedulerPolicyTest, FourHourBoundary)
{
    const QDateTime last = fixedTime(8);

    EXPECT_FALSE(SyncScheduler::shouldRunFullSync(last, last.addSecs(3 * 3600 + 59 * 60)));
    EXPECT_TRUE(SyncScheduler::shouldRunFullSync(last, last.addSecs(4 * 3600)));
    EXPECT_TRUE(SyncScheduler::shouldRunFullSync(last, last.addSecs(30 * 3600)));
}

TEST(SyncSchedulerPolicyTest, CustomInterval)
{
    const QDateTime last = fixedTime(8);

    EXPECT_FALSE(SyncScheduler::shouldRunFullSync(last, last.addSecs(3600), 2));
    EXPECT_TRUE(SyncScheduler::shouldRunFullSync(last, last.addSecs(2 * 3600), 2));
}

class SyncSchedulerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_db.opened);
        m_now = fixedTime(12);
        m_scheduler = std::make_unique<SyncScheduler>(m_db.get(), &m_catalog, &m_lock);
        m_scheduler->setClock([this]() { return m_now; });
        m_scheduler->setRunInBackground(false);
    }

    void TearDown() override
    {
        m_scheduler.reset();
    }

    void seed()
    {
        EngineState state;
        state.librarySeeded = true;
        state.lastFullSyncAt = m_now;
        m_scheduler->setEngineState(state);
        ASSERT_TRUE(m_scheduler->runFullSyncNow().succeeded());
    }

    TempDatabase m_db;
    FakeMediaCatalog m_catalog;
    QMutex m_lock;
    QDateTime m_now;
    std::unique_ptr<SyncScheduler> m_scheduler;
};

TEST_F(SyncSchedulerTest, FirstLaunchSeedsLibrary)
{
    m_catalog.add("a", "Song A", 3);
    m_catalog.add("b", "Song B", 0);

    QList<int> seeding;
    int syncing = 0;
    QObject::connect(m_scheduler.get(), &SyncScheduler::seedingProgress,
                     [&seeding](int current, int, const QString&) { seeding.append(current); });
    QObject::connect(m_scheduler.get(), &SyncScheduler::syncProgress,
                     [&syncing](int, int, const QString&) { ++syncing; });

    m_scheduler->onAppLaunched();

    EXPECT_FALSE(seeding.isEmpty());
    EXPECT_EQ(2, seeding.last());
    EXPECT_EQ(0, syncing);

    EXPECT_EQ(2, m_db->getTotalTracks());
    EXPECT_EQ(0, m_db->getTotalPlayFacts());
    EXPECT_EQ(3, m_db->getTrackByPersistentId("a").baselineCounter);

    EXPECT_TRUE(m_scheduler->engineState().librarySeeded);
    EXPECT_EQ(m_now, m_scheduler->engineState().lastFullSyncAt);

    const EngineState stored = m_db->loadEngineState();
    EXPECT_TRUE(stored.librarySeeded);
    EXPECT_EQ(m_now, stored.lastFullSyncAt);
}

TEST_F(SyncSchedulerTest, ForegroundWithinIntervalChecksCurrentTrackOnly)
{
    m_catalog.add("a", "Song A", 1);
    m_catalog.add("b", "Song B", 1);
    seed();
    const int enumerations = m_catalog.enumerateCalls;

    m_catalog.setPlayCount("a", 2);
    m_catalog.setPlayCount("b", 5);
    m_catalog.currentId = "a";
    m_now = m_now.addSecs(3600);

    bool quickFinished = false;
    QObject::connect(m_scheduler.get(), &SyncScheduler::quickSyncFinished,
                     [&quickFinished](const ReconciliationReport&) { quickFinished = true; });

    m_scheduler->onAppForegrounded();

    EXPECT_TRUE(quickFinished);
    EXPECT_EQ(enumerations, m_catalog.enumerateCalls);
    EXPECT_EQ(2, m_db->getTrackByPersistentId("a").lastSeenCounter);
    EXPECT_EQ(1, m_db->getTrackByPersistentId("b").lastSeenCounter);
}

TEST_F(SyncSchedulerTest, QuickSyncWithNothingPlayingIsHarmless)
{
    m_catalog.add("a", "Song A", 1);
    seed();
    m_now = m_now.addSecs(60);

    ReconciliationReport report = m_scheduler->runQuickSync();

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(0, report.tracksProcessed);
}

TEST_F(SyncSchedulerTest, ForegroundAfterIntervalRunsFullSync)
{
    m_catalog.add("a", "Song A", 1);
    m_catalog.add("b", "Song B", 1);
    seed();
    const int enumerations = m_catalog.enumerateCalls;

    m_catalog.setPlayCount("b", 3);
    m_now = m_now.addSecs(4 * 3600);

    int progress = 0;
    QObject::connect(m_scheduler.get(), &SyncScheduler::syncProgress,
                     [&progress](int, int, const QString&) { ++progress; });

    m_scheduler->onAppForegrounded();

    EXPECT_EQ(enumerations + 1, m_catalog.enumerateCalls);
    EXPECT_GT(progress, 0);
    EXPECT_EQ(3, m_db->getTrackByPersistentId("b").lastSeenCounter);
    EXPECT_EQ(2, m_db->getTotalPlayFacts());
    EXPECT_EQ(m_now, m_db->loadEngineState().lastFullSyncAt);
}

TEST_F(SyncSchedulerTest, PermissionDeniedStopsAutomaticSyncs)
{
    m_catalog.add("a", "Song A", 1);
    m_catalog.error = SyncError::PermissionDenied;

    int denied = 0;
    SyncError failure = SyncError::None;
    QObject::connect(m_scheduler.get(), &SyncScheduler::permissionDenied, [&denied]() { ++denied; });
    QObject::connect(m_scheduler.get(), &SyncScheduler::syncFailed,
                     [&failure](SyncError error, const QString&) { failure = error; });

    m_scheduler->onAppLaunched();

    EXPECT_EQ(1, denied);
    EXPECT_EQ(SyncError::PermissionDenied, failure);
    EXPECT_TRUE(m_scheduler->isPermissionDenied());
    EXPECT_FALSE(m_scheduler->engineState().librarySeeded);
    EXPECT_FALSE(m_scheduler->isSyncing());

    m_scheduler->onAppForegrounded();
    EXPECT_EQ(1, m_catalog.enumerateCalls);

    // Access granted again; an explicit request retries
    m_catalog.error = SyncError::None;
    m_scheduler->requestFullSync();

    EXPECT_FALSE(m_scheduler->isPermissionDenied());
    EXPECT_EQ(2, m_catalog.enumerateCalls);
    EXPECT_TRUE(m_scheduler->engineState().librarySeeded);
}

TEST_F(SyncSchedulerTest, TransientFailureIsRetriedOnNextTrigger)
{
    m_catalog.add("a", "Song A", 1);
    m_catalog.error = SyncError::CatalogUnavailable;

    m_scheduler->onAppLaunched();
    EXPECT_FALSE(m_scheduler->isPermissionDenied());
    EXPECT_FALSE(m_scheduler->engineState().librarySeeded);

    m_catalog.error = SyncError::None;
    m_scheduler->onAppForegrounded();

    EXPECT_EQ(2, m_catalog.enumerateCalls);
    EXPECT_TRUE(m_scheduler->engineState().librarySeeded);
    EXPECT_EQ(1, m_db->getTotalTracks());
}

TEST_F(SyncSchedulerTest, BackgroundSyncDeliversReportOnOwnerThread)
{
    for (int i = 0; i < 10; ++i) {
        m_catalog.add(QString("t%1").arg(i), QString("Song %1").arg(i), i);
    }
    m_scheduler->setRunInBackground(true);
    m_scheduler->setBatchSize(3);

    QEventLoop loop;
    bool finished = false;
    ReconciliationReport delivered;
    QObject::connect(m_scheduler.get(), &SyncScheduler::fullSyncFinished,
                     [&](const ReconciliationReport& report) {
                         finished = true;
                         delivered = report;
                         loop.quit();
                     });
    QObject::connect(m_scheduler.get(), &SyncScheduler::syncFailed, &loop, &QEventLoop::quit);
    QTimer::singleShot(10000, &loop, &QEventLoop::quit);

    m_scheduler->onAppLaunched();
    EXPECT_TRUE(m_scheduler->isSyncing());

    // A second trigger while syncing is ignored
    m_scheduler->onAppForegrounded();

    loop.exec();

    ASSERT_TRUE(finished);
    EXPECT_EQ(10, delivered.tracksCreated);
    EXPECT_EQ(4, delivered.batchesCommitted);
    EXPECT_EQ(1, m_catalog.enumerateCalls);
    EXPECT_FALSE(m_scheduler->isSyncing());
    EXPECT_EQ(10, m_db->getTotalTracks());
    EXPECT_TRUE(m_db->loadEngineState().librarySeeded);
}

} // namespace
} // namespace Encore
