#include "trackingengine.h"

#include <QDebug>
#include <QMutexLocker>

#include "../charts/chartaggregator.h"
#include "../database/databasemanager.h"
#include "../playback/playbacksampler.h"
#include "../settings/settingsmanager.h"
#include "../sync/syncscheduler.h"
#include "../tracking/livetrackingsession.h"

namespace Encore {

TrackingEngine::TrackingEngine(DatabaseManager* database, MediaCatalog* catalog,
                               PlaybackSampler* sampler, QObject *parent)
    : QObject(parent)
    , m_database(database)
    , m_catalog(catalog)
    , m_sampler(sampler)
    , m_session(new LiveTrackingSession(this))
    , m_scheduler(new SyncScheduler(database, catalog, &m_lock, this))
    , m_charts(new ChartAggregator(database, this))
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
{
    m_charts->setWriteLock(&m_lock);

    connect(m_session, &LiveTrackingSession::playCompleted,
            this, &TrackingEngine::onPlayCompleted);

    connect(m_charts, &ChartAggregator::rankChanged,
            this, [this](int trackId, int oldRank, int newRank, ChartPeriod period) {
        if (period == ChartPeriod::AllTime) {
            emit rankChanged(trackId, oldRank, newRank);
        }
    });

    if (m_sampler) {
        connect(m_sampler, &PlaybackSampler::trackChanged,
                m_session, &LiveTrackingSession::onTrackChanged);
        connect(m_sampler, &PlaybackSampler::playbackStarted,
                m_session, &LiveTrackingSession::onPlaybackStarted);
        connect(m_sampler, &PlaybackSampler::playbackPaused,
                m_session, &LiveTrackingSession::onPlaybackPaused);
        connect(m_sampler, &PlaybackSampler::playbackStopped,
                m_session, &LiveTrackingSession::onPlaybackStopped);
        connect(m_sampler, &PlaybackSampler::playbackInterrupted,
                m_session, &LiveTrackingSession::onPlaybackInterrupted);
        connect(m_sampler, &PlaybackSampler::playerAppeared,
                this, &TrackingEngine::onAppForegrounded);
    }

    qDebug() << "[TrackingEngine] Initialized";
}

TrackingEngine::~TrackingEngine()
{
    shutdown();
}

void TrackingEngine::setClock(Clock clock)
{
    if (!clock) {
        return;
    }
    m_clock = clock;
    m_session->setClock(clock);
    m_scheduler->setClock(clock);
    m_charts->setClock(clock);
}

void TrackingEngine::setSettingsManager(SettingsManager* settingsManager)
{
    if (m_settingsManager) {
        disconnect(m_settingsManager, nullptr, this, nullptr);
    }

    m_settingsManager = settingsManager;

    if (m_settingsManager) {
        // Load initial state from settings
        m_session->setEnabled(m_settingsManager->trackingEnabled());
        m_scheduler->setFullSyncIntervalHours(m_settingsManager->fullSyncIntervalHours());
        m_scheduler->setBatchSize(m_settingsManager->reconcileBatchSize());
        m_notifyRankChanges = m_settingsManager->notifyRankChanges();

        connect(m_settingsManager, &SettingsManager::trackingEnabledChanged,
                m_session, &LiveTrackingSession::setEnabled);
        connect(m_settingsManager, &SettingsManager::fullSyncIntervalHoursChanged,
                this, [this](int hours) { m_scheduler->setFullSyncIntervalHours(hours); });
        connect(m_settingsManager, &SettingsManager::reconcileBatchSizeChanged,
                this, [this](int batchSize) { m_scheduler->setBatchSize(batchSize); });
        connect(m_settingsManager, &SettingsManager::notifyRankChangesChanged,
                this, [this](bool notify) { m_notifyRankChanges = notify; });
    }
}

bool TrackingEngine::start()
{
    if (m_started) {
        return true;
    }

    if (!m_database || !m_database->isOpen()) {
        qCritical() << "[TrackingEngine] Cannot start without an open database";
        return false;
    }

    m_scheduler->setEngineState(m_database->loadEngineState());

    if (m_sampler && !m_sampler->start()) {
        // Counter sync still works without live observation
        qWarning() << "[TrackingEngine] Playback sampler failed to start; live plays will not be seen";
    }

    m_started = true;
    m_scheduler->onAppLaunched();
    return true;
}

void TrackingEngine::shutdown()
{
    if (!m_started) {
        return;
    }
    m_started = false;

    qDebug() << "[TrackingEngine] Shutting down";
    m_session->finalize();
    m_scheduler->shutdown();
    if (m_sampler) {
        m_sampler->stop();
    }
}

void TrackingEngine::onAppForegrounded()
{
    m_scheduler->onAppForegrounded();
}

void TrackingEngine::onPlayCompleted(const CatalogEntry& track, const PlayFact& fact)
{
    recordLivePlay(track, fact);
}

int TrackingEngine::resolveTrack(const CatalogEntry& entry, const QDateTime& now, bool* counterKnown)
{
    TrackRecord track = m_database->getTrackByPersistentId(entry.persistentId);
    if (track.isValid()) {
        *counterKnown = track.counterKnown;
        if (track.duration <= 0 && entry.durationSeconds > 0) {
            QVariantMap changes;
            changes["duration"] = entry.durationSeconds;
            if (!m_database->updateTrack(track.id, changes)) {
                qWarning() << "[TrackingEngine] Could not store duration for" << entry.title;
            }
        }
        return track.id;
    }

    // Whether the player's counter already includes this play is unknown, so
    // the counter is left unset until the next reconciliation reads it.
    TrackRecord created;
    created.persistentId = entry.persistentId;
    created.title = entry.title;
    created.artist = entry.artist;
    created.album = entry.album;
    created.duration = entry.durationSeconds > 0 ? entry.durationSeconds : 0.0;
    created.counterKnown = false;
    created.lastReconciledAt = now;
    created.createdAt = now;

    *counterKnown = false;
    return m_database->insertTrack(created);
}

bool TrackingEngine::recordLivePlay(const CatalogEntry& track, const PlayFact& fact)
{
    if (!m_database || !track.isValid()) {
        dropPlay(track, "no database or track");
        return false;
    }

    const QDateTime current = now();
    int trackId = 0;
    PlayFact stored = fact;

    {
        QMutexLocker locker(&m_lock);

        if (!m_database->beginTransaction()) {
            dropPlay(track, "could not start a transaction");
            return false;
        }

        bool counterKnown = false;
        trackId = resolveTrack(track, current, &counterKnown);
        if (trackId <= 0) {
            m_database->rollbackTransaction();
            dropPlay(track, "could not create the track");
            return false;
        }

        stored.trackId = trackId;
        stored.source = PlaySource::Live;
        if (!stored.timestamp.isValid()) {
            stored.timestamp = current;
        }

        if (m_database->insertPlayFact(stored) <= 0) {
            m_database->rollbackTransaction();
            dropPlay(track, "could not store the play");
            return false;
        }

        // The player's counter will report this play again
        if (counterKnown) {
            const TrackRecord record = m_database->getTrack(trackId);
            QVariantMap changes;
            changes["pendingLivePlays"] = record.pendingLivePlays + 1;
            if (!m_database->updateTrack(trackId, changes)) {
                m_database->rollbackTransaction();
                dropPlay(track, "could not update the track");
                return false;
            }
        }

        if (!m_database->commitTransaction()) {
            m_database->rollbackTransaction();
            dropPlay(track, "commit failed");
            return false;
        }

        qDebug() << "[TrackingEngine] Live play recorded:" << track.title << "by" << track.artist;
    }

    emit playRecorded(trackId, stored);

    checkRankChange(trackId, track.title);
    return true;
}

void TrackingEngine::dropPlay(const CatalogEntry& track, const QString& reason)
{
    qWarning() << "[TrackingEngine] Dropping play of" << track.title << "-" << reason;
    emit playDropped(track.persistentId, reason);
}

void TrackingEngine::checkRankChange(int trackId, const QString& title)
{
    const QList<ChartEntry> chart = m_charts->rankedTracks(ChartPeriod::AllTime);

    for (const ChartEntry& entry : chart) {
        if (entry.track.id != trackId) {
            continue;
        }
        if (entry.previousRank > 0 && entry.previousRank != entry.rank) {
            const QString message = chartMovementMessage(title, entry.previousRank, entry.rank);
            qInfo() << "[TrackingEngine]" << message;
            if (m_notifyRankChanges) {
                emit chartMovement(message);
            }
        }
        break;
    }
}

QString TrackingEngine::chartMovementMessage(const QString& title, int previousRank, int currentRank)
{
    if (currentRank == 1) {
        return QString("'%1' just jumped to #1 on your chart!").arg(title);
    }
    if (previousRank > 0 && currentRank < previousRank) {
        return QString("'%1' climbed to #%2 (up %3 spots)")
            .arg(title)
            .arg(currentRank)
            .arg(previousRank - currentRank);
    }
    return QString("'%1' moved to #%2").arg(title).arg(currentRank);
}

QDateTime TrackingEngine::now() const
{
    return m_clock();
}

} // namespace Encore
