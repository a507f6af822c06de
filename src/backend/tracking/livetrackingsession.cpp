#include "livetrackingsession.h"

#include <QDebug>

#include "completionevaluator.h"

namespace Encore {

LiveTrackingSession::LiveTrackingSession(QObject *parent)
    : QObject(parent)
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
    , m_tickTimer(new QTimer(this))
{
    m_tickTimer->setInterval(TICK_INTERVAL_MS);
    connect(m_tickTimer, &QTimer::timeout, this, &LiveTrackingSession::tick);

    qDebug() << "[LiveTrackingSession] Initialized";
}

LiveTrackingSession::~LiveTrackingSession()
{
}

void LiveTrackingSession::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

bool LiveTrackingSession::enabled() const
{
    return m_enabled;
}

void LiveTrackingSession::setEnabled(bool enabled)
{
    if (m_enabled != enabled) {
        m_enabled = enabled;
        emit enabledChanged(m_enabled);
        qDebug() << "[LiveTrackingSession] Tracking" << (m_enabled ? "enabled" : "disabled");
    }
}

double LiveTrackingSession::listenedSeconds() const
{
    return m_accumulatedSeconds + segmentSeconds();
}

void LiveTrackingSession::onTrackChanged(const CatalogEntry& track, bool playing)
{
    if (hasTrack() && track == m_track) {
        // Players resend metadata for the same item; pick up a late duration
        if (m_track.durationSeconds <= 0 && track.durationSeconds > 0) {
            m_track.durationSeconds = track.durationSeconds;
        }
        if (playing && m_state == Idle) {
            enterTracking();
        }
        return;
    }

    // The outgoing track is settled before the new one starts counting
    if (hasTrack()) {
        finalize();
    }

    if (!track.isValid()) {
        qDebug() << "[LiveTrackingSession] Track cleared";
        return;
    }

    startSession(track, playing);
}

void LiveTrackingSession::onPlaybackStarted(const CatalogEntry& track)
{
    if (track.isValid() && (!hasTrack() || track != m_track)) {
        onTrackChanged(track, true);
        return;
    }

    if (!hasTrack()) {
        qDebug() << "[LiveTrackingSession] Playback started without a track";
        return;
    }

    if (m_state == Idle) {
        qDebug() << "[LiveTrackingSession] Playback resumed - accumulated:"
                 << m_accumulatedSeconds << "s";
        enterTracking();
    }
}

void LiveTrackingSession::onPlaybackPaused()
{
    leaveTracking("paused");
}

void LiveTrackingSession::onPlaybackStopped()
{
    leaveTracking("stopped");
}

void LiveTrackingSession::onPlaybackInterrupted()
{
    leaveTracking("interrupted");
}

void LiveTrackingSession::tick()
{
    if (m_state != Tracking || m_completionEmitted) {
        return;
    }

    const double provisional = listenedSeconds();
    if (CompletionEvaluator::isComplete(provisional, m_track.durationSeconds)) {
        qDebug() << "[LiveTrackingSession] Completion threshold reached:"
                 << provisional << "of" << m_track.durationSeconds << "s";
        emitPlay(provisional);
    }
}

void LiveTrackingSession::finalize()
{
    if (!hasTrack()) {
        return;
    }

    if (m_state == Tracking) {
        m_accumulatedSeconds += segmentSeconds();
    }

    // Catches a threshold crossed between ticks or while the app was suspended
    if (!m_completionEmitted
        && CompletionEvaluator::isComplete(m_accumulatedSeconds, m_track.durationSeconds)) {
        qDebug() << "[LiveTrackingSession] Completion reached on finalize:"
                 << m_accumulatedSeconds << "of" << m_track.durationSeconds << "s";
        emitPlay(m_accumulatedSeconds);
    }

    qDebug() << "[LiveTrackingSession] Finalized" << m_track.title
             << "- listened" << m_accumulatedSeconds << "s"
             << (m_completionEmitted ? "(counted)" : "(not counted)");

    resetTrackState();
}

void LiveTrackingSession::startSession(const CatalogEntry& track, bool playing)
{
    m_track = track;
    m_accumulatedSeconds = 0.0;
    m_completionEmitted = false;
    m_sessionStartedAt = now();
    m_segmentStartedAt = QDateTime();

    if (track.durationSeconds <= 0) {
        qWarning() << "[LiveTrackingSession] Unknown duration for" << track.title
                   << "- listen will not be counted";
    }

    qDebug() << "[LiveTrackingSession] New track:" << track.title
             << "by" << track.artist
             << "- duration:" << track.durationSeconds << "s";

    if (playing) {
        enterTracking();
    }
}

void LiveTrackingSession::enterTracking()
{
    m_segmentStartedAt = now();
    setState(Tracking);
    if (!m_tickTimer->isActive()) {
        m_tickTimer->start();
    }
}

void LiveTrackingSession::leaveTracking(const char* reason)
{
    if (m_state != Tracking) {
        return;
    }

    m_accumulatedSeconds += segmentSeconds();
    m_segmentStartedAt = QDateTime();
    m_tickTimer->stop();
    setState(Idle);

    qDebug() << "[LiveTrackingSession] Playback" << reason << "- accumulated:"
             << m_accumulatedSeconds << "s";
}

void LiveTrackingSession::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

void LiveTrackingSession::emitPlay(double listenedSeconds)
{
    // Set before anything can fail; a dropped write is never retried
    m_completionEmitted = true;

    if (!m_enabled) {
        qDebug() << "[LiveTrackingSession] Tracking disabled, play of" << m_track.title << "ignored";
        return;
    }

    PlayFact fact;
    fact.timestamp = now();
    fact.source = PlaySource::Live;
    fact.listenedDuration = listenedSeconds;
    fact.trackDurationAtPlay = m_track.durationSeconds;
    fact.completionRatio = CompletionEvaluator::completionRatio(listenedSeconds, m_track.durationSeconds);

    emit playCompleted(m_track, fact);
}

void LiveTrackingSession::resetTrackState()
{
    m_tickTimer->stop();
    m_track = CatalogEntry();
    m_accumulatedSeconds = 0.0;
    m_completionEmitted = false;
    m_sessionStartedAt = QDateTime();
    m_segmentStartedAt = QDateTime();
    setState(Idle);
}

double LiveTrackingSession::segmentSeconds() const
{
    if (m_state != Tracking || !m_segmentStartedAt.isValid()) {
        return 0.0;
    }
    const qint64 elapsedMs = m_segmentStartedAt.msecsTo(now());
    return elapsedMs > 0 ? elapsedMs / 1000.0 : 0.0;
}

QDateTime LiveTrackingSession::now() const
{
    return m_clock();
}

} // namespace Encore
