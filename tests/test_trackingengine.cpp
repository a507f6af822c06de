#include <gtest/gtest.h>

#include <QEventLoop>
#include <QTimer>

#include "backend/charts/chartaggregator.h"
#include "backend/engine/trackingengine.h"
#include "backend/sync/syncscheduler.h"
#include "backend/tracking/livetrackingsession.h"
#include "fakes/fakemediacatalog.h"
#include "fakes/fakeplaybacksampler.h"
#include "testsupport.h"

namespace Encore {
namespace {

using Testing::TempDatabase;
using Testing::fixedTime;

TEST(ChartMovementMessageTest, Formats)
{
    EXPECT_EQ("'Harvest Moon' just jumped to #1 on your chart!",
              TrackingEngine::chartMovementMessage("Harvest Moon", 4, 1));
    EXPECT_EQ("'Harvest Moon' climbed to #3 (up 5 spots)",
              TrackingEngine::chartMovementMessage("Harvest Moon", 8, 3));
    EXPECT_EQ("'Harvest Moon' moved to #6",
              TrackingEngine::chartMovementMessage("Harvest Moon", 2, 6));
}

class TrackingEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_db.opened);
        m_now = fixedTime(12);
        m_engine = std::make_unique<TrackingEngine>(m_db.get(), &m_catalog, &m_sampler);
        m_engine->setClock([this]() { return m_now; });
        m_engine->scheduler()->setRunInBackground(false);

        QObject::connect(m_engine.get(), &TrackingEngine::playRecorded,
                         [this](int, const PlayFact& fact) { m_recorded.append(fact); });
        QObject::connect(m_engine.get(), &TrackingEngine::playDropped,
                         [this](const QString& id, const QString&) { m_dropped.append(id); });
        QObject::connect(m_engine.get(), &TrackingEngine::chartMovement,
                         [this](const QString& message) { m_messages.append(message); });
    }

    void TearDown() override
    {
        m_engine.reset();
    }

    PlayFact liveFact() const
    {
        PlayFact fact;
        fact.timestamp = m_now;
        fact.listenedDuration = 150.0;
        fact.trackDurationAtPlay = 200.0;
        fact.completionRatio = 0.75;
        return fact;
    }

    int total(const QString& id)
    {
        return m_engine->charts()->totalPlayCount(m_db->getTrackByPersistentId(id));
    }

    TempDatabase m_db;
    FakeMediaCatalog m_catalog;
    FakePlaybackSampler m_sampler;
    QDateTime m_now;
    std::unique_ptr<TrackingEngine> m_engine;

    QList<PlayFact> m_recorded;
    QStringList m_dropped;
    QStringList m_messages;
};

TEST_F(TrackingEngineTest, StartSeedsLibraryAndStartsSampler)
{
    m_catalog.add("a", "Song A", 4);

    ASSERT_TRUE(m_engine->start());

    EXPECT_TRUE(m_sampler.started);
    EXPECT_TRUE(m_db->loadEngineState().librarySeeded);
    EXPECT_EQ(4, total("a"));

    m_engine->shutdown();
    EXPECT_FALSE(m_sampler.started);
}

TEST_F(TrackingEngineTest, ListenThroughSamplerIsRecordedOnce)
{
    m_catalog.add("a", "Song A", 4);
    ASSERT_TRUE(m_engine->start());

    m_sampler.updatePlayerState(m_catalog.entry("a"), PlaybackSampler::Playing);
    m_now = m_now.addSecs(60);
    m_engine->session()->tick();
    EXPECT_TRUE(m_recorded.isEmpty());

    m_now = m_now.addSecs(50);
    m_engine->session()->tick();
    m_now = m_now.addSecs(5);
    m_engine->session()->tick();

    ASSERT_EQ(1, m_recorded.size());
    EXPECT_EQ(PlaySource::Live, m_recorded.first().source);
    EXPECT_EQ(5, total("a"));
    EXPECT_EQ(1, m_db->getTrackByPersistentId("a").pendingLivePlays);

    // The player counted the same play; the quick sync must not add another
    m_catalog.setPlayCount("a", 5);
    m_catalog.currentId = "a";
    ReconciliationReport report = m_engine->scheduler()->runQuickSync();

    EXPECT_EQ(0, report.playFactsCreated);
    EXPECT_EQ(1, report.liveFactsAbsorbed);
    EXPECT_EQ(5, total("a"));
}

TEST_F(TrackingEngineTest, LivePlayOfUnknownTrackWaitsForCounter)
{
    CatalogEntry entry = Testing::makeEntry("n", "New Song");

    ASSERT_TRUE(m_engine->recordLivePlay(entry, liveFact()));

    TrackRecord track = m_db->getTrackByPersistentId("n");
    ASSERT_TRUE(track.isValid());
    EXPECT_FALSE(track.counterKnown);
    EXPECT_EQ(0, track.pendingLivePlays);
    EXPECT_EQ(1, total("n"));

    const QList<PlayFact> facts = m_db->getPlayFacts(track.id);
    ASSERT_EQ(1, facts.size());
    ASSERT_TRUE(facts.first().completionRatio.has_value());
    EXPECT_DOUBLE_EQ(0.75, *facts.first().completionRatio);

    // The player's counter already holds years of plays plus this one
    m_catalog.add("n", "New Song", 10);
    m_catalog.currentId = "n";
    m_now = m_now.addSecs(600);
    m_engine->scheduler()->runQuickSync();

    track = m_db->getTrackByPersistentId("n");
    EXPECT_TRUE(track.counterKnown);
    EXPECT_EQ(9, track.baselineCounter);
    EXPECT_EQ(10, total("n"));
    EXPECT_EQ(1, m_db->getTotalPlayFacts());
}

TEST_F(TrackingEngineTest, JumpToTopIsAnnounced)
{
    m_catalog.add("a", "Song A", 3);
    m_catalog.add("b", "Song B", 3);
    ASSERT_TRUE(m_engine->start());
    m_engine->charts()->rankedTracks(ChartPeriod::AllTime);

    QList<int> moved;
    QObject::connect(m_engine.get(), &TrackingEngine::rankChanged,
                     [&moved](int trackId, int, int) { moved.append(trackId); });

    ASSERT_TRUE(m_engine->recordLivePlay(m_catalog.entry("b"), liveFact()));

    ASSERT_EQ(1, m_messages.size());
    EXPECT_EQ("'Song B' just jumped to #1 on your chart!", m_messages.first());
    EXPECT_EQ(2, moved.size());
    EXPECT_TRUE(moved.contains(m_db->getTrackByPersistentId("b").id));
}

TEST_F(TrackingEngineTest, AnnouncementsCanBeTurnedOff)
{
    m_catalog.add("a", "Song A", 3);
    m_catalog.add("b", "Song B", 3);
    ASSERT_TRUE(m_engine->start());
    m_engine->charts()->rankedTracks(ChartPeriod::AllTime);
    m_engine->setNotifyRankChanges(false);

    ASSERT_TRUE(m_engine->recordLivePlay(m_catalog.entry("b"), liveFact()));

    EXPECT_TRUE(m_messages.isEmpty());
    EXPECT_EQ(1, m_recorded.size());
}

TEST_F(TrackingEngineTest, FailedWriteDropsPlay)
{
    m_catalog.add("a", "Song A", 3);
    ASSERT_TRUE(m_engine->start());
    m_engine->shutdown();
    m_db->close();

    EXPECT_FALSE(m_engine->recordLivePlay(m_catalog.entry("a"), liveFact()));

    EXPECT_EQ(QStringList({"a"}), m_dropped);
    EXPECT_TRUE(m_recorded.isEmpty());
}

TEST_F(TrackingEngineTest, DroppedPlayStillEndsTheListen)
{
    m_catalog.add("a", "Song A", 3);
    ASSERT_TRUE(m_engine->start());
    m_db->close();

    m_sampler.updatePlayerState(m_catalog.entry("a"), PlaybackSampler::Playing);
    m_now = m_now.addSecs(120);
    m_engine->session()->tick();
    m_now = m_now.addSecs(60);
    m_engine->session()->tick();

    EXPECT_EQ(1, m_dropped.size());
    EXPECT_TRUE(m_engine->session()->completionEmitted());
}

TEST_F(TrackingEngineTest, LivePlaysDuringBackgroundSyncStayConsistent)
{
    const int trackCount = 40;
    for (int i = 0; i < trackCount; ++i) {
        m_catalog.add(QString("t%1").arg(i), QString("Song %1").arg(i), 3);
    }
    ASSERT_TRUE(m_engine->start());
    m_engine->charts()->rankedTracks(ChartPeriod::AllTime);

    // Two unseen plays per track, then a full sync one track per batch
    for (int i = 0; i < trackCount; ++i) {
        m_catalog.setPlayCount(QString("t%1").arg(i), 5);
    }
    m_now = m_now.addSecs(5 * 3600);
    m_engine->scheduler()->setRunInBackground(true);
    m_engine->scheduler()->setBatchSize(1);

    QEventLoop loop;
    bool finished = false;
    ReconciliationReport delivered;
    QObject::connect(m_engine->scheduler(), &SyncScheduler::fullSyncFinished,
                     [&](const ReconciliationReport& report) {
                         finished = true;
                         delivered = report;
                         loop.quit();
                     });
    QObject::connect(m_engine->scheduler(), &SyncScheduler::syncFailed,
                     [&](SyncError error, const QString&) {
                         delivered.error = error;
                         loop.quit();
                     });
    QTimer::singleShot(20000, &loop, &QEventLoop::quit);

    m_engine->onAppForegrounded();
    ASSERT_TRUE(m_engine->scheduler()->isSyncing());

    // Listens land while batches commit on the worker connection
    for (int i = 0; i < trackCount; i += 2) {
        ASSERT_TRUE(m_engine->recordLivePlay(m_catalog.entry(QString("t%1").arg(i)), liveFact()));
    }

    loop.exec();

    EXPECT_EQ(SyncError::None, delivered.error);
    ASSERT_TRUE(finished);
    EXPECT_TRUE(m_dropped.isEmpty());
    EXPECT_EQ(trackCount / 2, m_recorded.size());

    // Whether a listen was absorbed by the sync or is still pending, the
    // ledger equals the player's counter plus the plays it has yet to report
    for (int i = 0; i < trackCount; ++i) {
        const QString id = QString("t%1").arg(i);
        const TrackRecord track = m_db->getTrackByPersistentId(id);
        EXPECT_EQ(5, track.lastSeenCounter) << id.toStdString();
        EXPECT_EQ(5 + track.pendingLivePlays, total(id)) << id.toStdString();
        EXPECT_EQ(i % 2 == 0 ? 1 : 0, m_db->countPlayFactsBySource(track.id, PlaySource::Live))
            << id.toStdString();
    }
}

} // namespace
} // namespace Encore
