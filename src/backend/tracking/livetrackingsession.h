#ifndef LIVETRACKINGSESSION_H
#define LIVETRACKINGSESSION_H

#include <QObject>
#include <QDateTime>
#include <QTimer>
#include <functional>

#include "../catalog/catalogentry.h"
#include "../library/playfact.h"

namespace Encore {

// Follows the now-playing track and accumulates the time actually heard.
// Emits playCompleted at most once per tracked listen of a track.
class LiveTrackingSession : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool enabled READ enabled WRITE setEnabled NOTIFY enabledChanged)
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum State {
        Idle,
        Tracking
    };
    Q_ENUM(State)

    using Clock = std::function<QDateTime()>;

    explicit LiveTrackingSession(QObject *parent = nullptr);
    ~LiveTrackingSession();

    // Tests replace the wall clock; the default is QDateTime::currentDateTimeUtc
    void setClock(Clock clock);

    bool enabled() const;
    void setEnabled(bool enabled);

    State state() const { return m_state; }
    bool hasTrack() const { return m_track.isValid(); }
    CatalogEntry currentTrack() const { return m_track; }
    QDateTime sessionStartedAt() const { return m_sessionStartedAt; }
    bool completionEmitted() const { return m_completionEmitted; }

    // Accumulated plus the running segment, in seconds
    double listenedSeconds() const;

    static constexpr int TICK_INTERVAL_MS = 1000;

public slots:
    void onTrackChanged(const Encore::CatalogEntry& track, bool playing);
    void onPlaybackStarted(const Encore::CatalogEntry& track);
    void onPlaybackPaused();
    void onPlaybackStopped();
    void onPlaybackInterrupted();
    void tick();
    void finalize();

signals:
    void enabledChanged(bool enabled);
    void stateChanged(Encore::LiveTrackingSession::State state);
    void playCompleted(const Encore::CatalogEntry& track, const Encore::PlayFact& fact);

private:
    void startSession(const CatalogEntry& track, bool playing);
    void enterTracking();
    void leaveTracking(const char* reason);
    void setState(State state);
    void emitPlay(double listenedSeconds);
    void resetTrackState();
    double segmentSeconds() const;
    QDateTime now() const;

    Clock m_clock;
    QTimer* m_tickTimer = nullptr;
    bool m_enabled = true;

    State m_state = Idle;
    CatalogEntry m_track;
    QDateTime m_sessionStartedAt;
    QDateTime m_segmentStartedAt;
    double m_accumulatedSeconds = 0.0;
    bool m_completionEmitted = false;
};

} // namespace Encore

#endif // LIVETRACKINGSESSION_H
