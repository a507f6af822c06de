#include "playbacksampler.h"

#include <QDebug>

namespace Encore {

PlaybackSampler::PlaybackSampler(QObject *parent)
    : QObject(parent)
{
}

PlaybackSampler::~PlaybackSampler()
{
}

void PlaybackSampler::updateNowPlaying(const CatalogEntry& entry)
{
    if (entry == m_nowPlaying) {
        // Same item; only forward metadata that arrived late
        if (entry.isValid()
            && (entry.durationSeconds != m_nowPlaying.durationSeconds
                || entry.title != m_nowPlaying.title)) {
            m_nowPlaying = entry;
            emit trackChanged(m_nowPlaying, isPlaying());
        }
        return;
    }

    qDebug() << "[PlaybackSampler] Now playing:"
             << (entry.isValid() ? entry.title : QStringLiteral("<nothing>"));

    m_nowPlaying = entry;
    emit trackChanged(m_nowPlaying, isPlaying());
}

void PlaybackSampler::updatePlaybackStatus(PlaybackStatus status)
{
    if (status == m_status) {
        return;
    }

    m_status = status;
    emit statusChanged(m_status);

    switch (m_status) {
    case Playing:
        emit playbackStarted(m_nowPlaying);
        break;
    case Paused:
        emit playbackPaused();
        break;
    case Stopped:
        emit playbackStopped();
        break;
    }
}

void PlaybackSampler::updatePlayerState(const CatalogEntry& entry, PlaybackStatus status)
{
    if (status == Playing) {
        updateNowPlaying(entry);
        updatePlaybackStatus(status);
    } else {
        updatePlaybackStatus(status);
        updateNowPlaying(entry);
    }
}

void PlaybackSampler::reportInterruption()
{
    qDebug() << "[PlaybackSampler] Playback interrupted";

    const bool wasActive = m_status != Stopped;
    m_status = Stopped;
    m_nowPlaying = CatalogEntry();

    if (wasActive) {
        emit statusChanged(m_status);
    }
    emit playbackInterrupted();
}

void PlaybackSampler::reportPlayerAppeared()
{
    qDebug() << "[PlaybackSampler] Player appeared";
    emit playerAppeared();
}

} // namespace Encore
