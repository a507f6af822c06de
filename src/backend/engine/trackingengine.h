#ifndef TRACKINGENGINE_H
#define TRACKINGENGINE_H

#include <QObject>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <functional>

#include "../catalog/catalogentry.h"
#include "../library/playfact.h"

namespace Encore {

class DatabaseManager;
class MediaCatalog;
class PlaybackSampler;
class LiveTrackingSession;
class SyncScheduler;
class ChartAggregator;
class SettingsManager;

// Owns the reconciliation lock and wires the sampler, live session,
// scheduler and charts together.
class TrackingEngine : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    // sampler may be null when only syncing or printing charts
    TrackingEngine(DatabaseManager* database, MediaCatalog* catalog,
                   PlaybackSampler* sampler = nullptr, QObject *parent = nullptr);
    ~TrackingEngine();

    void setClock(Clock clock);
    void setSettingsManager(SettingsManager* settingsManager);
    void setNotifyRankChanges(bool notify) { m_notifyRankChanges = notify; }

    LiveTrackingSession* session() const { return m_session; }
    SyncScheduler* scheduler() const { return m_scheduler; }
    ChartAggregator* charts() const { return m_charts; }
    QMutex* reconciliationLock() { return &m_lock; }

    // Loads engine state, starts observing and runs the launch sync
    bool start();
    // Settles the current listen and waits for a running sync
    void shutdown();

    // Stores one live play. On failure the play is dropped, never retried.
    bool recordLivePlay(const CatalogEntry& track, const PlayFact& fact);

    static QString chartMovementMessage(const QString& title, int previousRank, int currentRank);

public slots:
    void onAppForegrounded();

signals:
    void playRecorded(int trackId, const Encore::PlayFact& fact);
    void playDropped(const QString& persistentId, const QString& reason);
    void rankChanged(int trackId, int oldRank, int newRank);
    void chartMovement(const QString& message);

private slots:
    void onPlayCompleted(const Encore::CatalogEntry& track, const Encore::PlayFact& fact);

private:
    int resolveTrack(const CatalogEntry& entry, const QDateTime& now, bool* counterKnown);
    void dropPlay(const CatalogEntry& track, const QString& reason);
    void checkRankChange(int trackId, const QString& title);
    QDateTime now() const;

    DatabaseManager* m_database;
    MediaCatalog* m_catalog;
    PlaybackSampler* m_sampler;
    SettingsManager* m_settingsManager = nullptr;

    QMutex m_lock;
    LiveTrackingSession* m_session;
    SyncScheduler* m_scheduler;
    ChartAggregator* m_charts;

    Clock m_clock;
    bool m_notifyRankChanges = true;
    bool m_started = false;
};

} // namespace Encore

#endif // TRACKINGENGINE_H
