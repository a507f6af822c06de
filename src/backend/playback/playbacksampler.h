#ifndef PLAYBACKSAMPLER_H
#define PLAYBACKSAMPLER_H

#include <QObject>

#include "../catalog/catalogentry.h"

namespace Encore {

// Turns a player's raw now-playing and status updates into discrete events.
// Repeated updates carrying the same state produce no signal.
class PlaybackSampler : public QObject
{
    Q_OBJECT

    Q_PROPERTY(PlaybackStatus status READ status NOTIFY statusChanged)

public:
    enum PlaybackStatus {
        Stopped,
        Playing,
        Paused
    };
    Q_ENUM(PlaybackStatus)

    explicit PlaybackSampler(QObject *parent = nullptr);
    ~PlaybackSampler();

    virtual bool start() = 0;
    virtual void stop() = 0;

    CatalogEntry nowPlaying() const { return m_nowPlaying; }
    PlaybackStatus status() const { return m_status; }
    bool isPlaying() const { return m_status == Playing; }

signals:
    void statusChanged(Encore::PlaybackSampler::PlaybackStatus status);
    void trackChanged(const Encore::CatalogEntry& track, bool playing);
    void playbackStarted(const Encore::CatalogEntry& track);
    void playbackPaused();
    void playbackStopped();
    void playbackInterrupted();
    void playerAppeared();

protected:
    void updateNowPlaying(const CatalogEntry& entry);
    void updatePlaybackStatus(PlaybackStatus status);
    // Applies both in the order that never credits a paused track with play time
    void updatePlayerState(const CatalogEntry& entry, PlaybackStatus status);
    void reportInterruption();
    void reportPlayerAppeared();

private:
    CatalogEntry m_nowPlaying;
    PlaybackStatus m_status = Stopped;
};

} // namespace Encore

#endif // PLAYBACKSAMPLER_H
