#include <gtest/gtest.h>

#include <QList>
#include <QPair>

#include "backend/tracking/livetrackingsession.h"
#include "testsupport.h"

namespace Encore {
namespace {

using Testing::fixedTime;
using Testing::makeEntry;

class LiveTrackingSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_now = fixedTime();
        m_session.setClock([this]() { return m_now; });
        QObject::connect(&m_session, &LiveTrackingSession::playCompleted,
                         [this](const CatalogEntry& track, const PlayFact& fact) {
            m_plays.append(qMakePair(track, fact));
        });
    }

    void advance(int seconds) { m_now = m_now.addSecs(seconds); }

    QDateTime m_now;
    LiveTrackingSession m_session;
    QList<QPair<CatalogEntry, PlayFact>> m_plays;
};

TEST_F(LiveTrackingSessionTest, OneEmissionForOneContinuousListen)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    EXPECT_EQ(LiveTrackingSession::Tracking, m_session.state());

    advance(100);
    m_session.tick();
    ASSERT_EQ(1, m_plays.size());

    advance(100);
    m_session.tick();
    m_session.onPlaybackPaused();
    m_session.finalize();

    EXPECT_EQ(1, m_plays.size());
}

TEST_F(LiveTrackingSessionTest, EmittedFactDescribesTheListen)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(120);
    m_session.tick();

    ASSERT_EQ(1, m_plays.size());
    const PlayFact& fact = m_plays.first().second;
    EXPECT_EQ("a", m_plays.first().first.persistentId);
    EXPECT_EQ(PlaySource::Live, fact.source);
    EXPECT_EQ(m_now, fact.timestamp);
    ASSERT_TRUE(fact.listenedDuration.has_value());
    EXPECT_DOUBLE_EQ(120.0, *fact.listenedDuration);
    ASSERT_TRUE(fact.trackDurationAtPlay.has_value());
    EXPECT_DOUBLE_EQ(200.0, *fact.trackDurationAtPlay);
    ASSERT_TRUE(fact.completionRatio.has_value());
    EXPECT_DOUBLE_EQ(0.6, *fact.completionRatio);
}

TEST_F(LiveTrackingSessionTest, BelowThresholdIsNotCounted)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(99);
    m_session.tick();
    m_session.onPlaybackStopped();
    m_session.finalize();

    EXPECT_TRUE(m_plays.isEmpty());
    EXPECT_FALSE(m_session.hasTrack());
}

TEST_F(LiveTrackingSessionTest, PausedTimeIsNotCounted)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(60);
    m_session.onPlaybackPaused();
    EXPECT_EQ(LiveTrackingSession::Idle, m_session.state());
    EXPECT_TRUE(m_session.hasTrack());

    advance(1000);
    m_session.tick();
    EXPECT_TRUE(m_plays.isEmpty());

    m_session.onPlaybackStarted(makeEntry("a", "Song A", 200.0));
    advance(39);
    m_session.tick();
    EXPECT_TRUE(m_plays.isEmpty());

    advance(1);
    m_session.tick();
    ASSERT_EQ(1, m_plays.size());
    EXPECT_DOUBLE_EQ(100.0, *m_plays.first().second.listenedDuration);
}

TEST_F(LiveTrackingSessionTest, InterruptionKeepsTheTrackForResume)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(70);
    m_session.onPlaybackInterrupted();
    EXPECT_DOUBLE_EQ(70.0, m_session.listenedSeconds());

    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(30);
    m_session.tick();
    EXPECT_EQ(1, m_plays.size());
}

TEST_F(LiveTrackingSessionTest, TrackChangeFinalizesMissedThreshold)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    // No tick ran while the app was suspended
    advance(150);

    m_session.onTrackChanged(makeEntry("b", "Song B", 300.0), true);

    ASSERT_EQ(1, m_plays.size());
    EXPECT_EQ("a", m_plays.first().first.persistentId);
    EXPECT_DOUBLE_EQ(150.0, *m_plays.first().second.listenedDuration);
    EXPECT_EQ("b", m_session.currentTrack().persistentId);
    EXPECT_DOUBLE_EQ(0.0, m_session.listenedSeconds());
    EXPECT_FALSE(m_session.completionEmitted());
}

TEST_F(LiveTrackingSessionTest, NewTrackThatIsNotPlayingWaitsForStart)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), false);
    EXPECT_EQ(LiveTrackingSession::Idle, m_session.state());
    advance(500);
    EXPECT_DOUBLE_EQ(0.0, m_session.listenedSeconds());

    m_session.onPlaybackStarted(makeEntry("a", "Song A", 200.0));
    EXPECT_EQ(LiveTrackingSession::Tracking, m_session.state());
    advance(100);
    m_session.tick();
    EXPECT_EQ(1, m_plays.size());
}

TEST_F(LiveTrackingSessionTest, UnknownDurationIsNeverCounted)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 0.0), true);
    advance(3600);
    m_session.tick();
    m_session.finalize();

    EXPECT_TRUE(m_plays.isEmpty());
}

TEST_F(LiveTrackingSessionTest, LateDurationIsPickedUp)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 0.0), true);
    advance(50);
    m_session.onTrackChanged(makeEntry("a", "Song A", 100.0), true);
    m_session.tick();

    EXPECT_EQ(1, m_plays.size());
}

TEST_F(LiveTrackingSessionTest, RepeatedListenOfSameTrackAfterFinalizeCountsAgain)
{
    m_session.onTrackChanged(makeEntry("a", "Song A", 100.0), true);
    advance(60);
    m_session.finalize();

    m_session.onTrackChanged(makeEntry("a", "Song A", 100.0), true);
    advance(60);
    m_session.tick();

    EXPECT_EQ(2, m_plays.size());
}

TEST_F(LiveTrackingSessionTest, DisabledSessionEmitsNothing)
{
    m_session.setEnabled(false);
    m_session.onTrackChanged(makeEntry("a", "Song A", 200.0), true);
    advance(200);
    m_session.tick();
    m_session.finalize();

    EXPECT_TRUE(m_plays.isEmpty());
}

} // namespace
} // namespace Encore
