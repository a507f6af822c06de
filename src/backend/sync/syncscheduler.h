#ifndef SYNCSCHEDULER_H
#define SYNCSCHEDULER_H

#include <QObject>
#include <QDateTime>
#include <QFuture>
#include <QFutureWatcher>
#include <atomic>
#include <functional>

#include "enginestate.h"
#include "syncerror.h"
#include "../reconcile/counterreconciler.h"

class QMutex;

namespace Encore {

class DatabaseManager;
class MediaCatalog;

// Chooses between a full catalog reconciliation and a check of the current
// track only. Full passes run on the thread pool with their own database
// connection; quick checks run inline.
class SyncScheduler : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool syncing READ isSyncing NOTIFY syncingChanged)

public:
    using Clock = std::function<QDateTime()>;

    SyncScheduler(DatabaseManager* database, MediaCatalog* catalog, QMutex* lock,
                  QObject *parent = nullptr);
    ~SyncScheduler();

    void setClock(Clock clock);
    void setEngineState(const EngineState& state) { m_state = state; }
    EngineState engineState() const { return m_state; }

    void setFullSyncIntervalHours(int hours);
    int fullSyncIntervalHours() const { return m_fullSyncIntervalHours; }
    void setBatchSize(int batchSize) { m_batchSize = qMax(1, batchSize); }

    // Off in tests and for one-shot command line runs
    void setRunInBackground(bool background) { m_runInBackground = background; }

    bool isSyncing() const { return m_syncing; }
    bool isPermissionDenied() const { return m_permissionDenied; }

    static bool shouldRunFullSync(const QDateTime& lastFullSyncAt, const QDateTime& now,
                                  int intervalHours = DEFAULT_FULL_SYNC_INTERVAL_HOURS);

    // Runs a full pass on the calling thread and returns its report
    ReconciliationReport runFullSyncNow();
    ReconciliationReport runQuickSync();

    // Stops after the running batch and waits for the worker
    void shutdown();

    static constexpr int DEFAULT_FULL_SYNC_INTERVAL_HOURS = 4;

public slots:
    void onAppLaunched();
    void onAppForegrounded();
    // Explicit user request; also clears a previous permission failure
    void requestFullSync();

signals:
    void syncingChanged(bool syncing);
    void seedingProgress(int current, int total, const QString& title);
    void syncProgress(int current, int total, const QString& title);
    void fullSyncFinished(const Encore::ReconciliationReport& report);
    void quickSyncFinished(const Encore::ReconciliationReport& report);
    void syncFailed(Encore::SyncError error, const QString& message);
    void permissionDenied();

private slots:
    void onFullSyncFinished();
    void onReconcileProgress(int current, int total, const QString& title);

private:
    void runScheduledSync(const char* trigger);
    void startFullSync(const QDateTime& now);
    ReconciliationReport performFullSync(const QString& databasePath, const QDateTime& now);
    void finishFullSync(const ReconciliationReport& report);
    void reportFailure(const ReconciliationReport& report);
    void setSyncing(bool syncing);
    QDateTime now() const;

    DatabaseManager* m_database;
    MediaCatalog* m_catalog;
    QMutex* m_lock;
    Clock m_clock;

    EngineState m_state;
    int m_fullSyncIntervalHours = DEFAULT_FULL_SYNC_INTERVAL_HOURS;
    int m_batchSize = CounterReconciler::DEFAULT_BATCH_SIZE;
    bool m_runInBackground = true;

    bool m_syncing = false;
    bool m_seeding = false;
    bool m_permissionDenied = false;
    std::atomic<bool> m_stopRequested{false};

    QFuture<ReconciliationReport> m_syncFuture;
    QFutureWatcher<ReconciliationReport> m_syncWatcher;
};

} // namespace Encore

#endif // SYNCSCHEDULER_H
