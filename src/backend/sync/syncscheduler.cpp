#include "syncscheduler.h"

#include <QDebug>
#include <QMutex>
#include <QThread>
#include <QtConcurrent/QtConcurrent>
#include <exception>

#include "../catalog/mediacatalog.h"
#include "../database/databasemanager.h"

namespace Encore {

SyncScheduler::SyncScheduler(DatabaseManager* database, MediaCatalog* catalog, QMutex* lock,
                             QObject *parent)
    : QObject(parent)
    , m_database(database)
    , m_catalog(catalog)
    , m_lock(lock)
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
{
    connect(&m_syncWatcher, &QFutureWatcher<ReconciliationReport>::finished,
            this, &SyncScheduler::onFullSyncFinished);
}

SyncScheduler::~SyncScheduler()
{
    shutdown();
}

void SyncScheduler::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

void SyncScheduler::setFullSyncIntervalHours(int hours)
{
    m_fullSyncIntervalHours = hours > 0 ? hours : DEFAULT_FULL_SYNC_INTERVAL_HOURS;
}

bool SyncScheduler::shouldRunFullSync(const QDateTime& lastFullSyncAt, const QDateTime& now,
                                      int intervalHours)
{
    if (!lastFullSyncAt.isValid()) {
        return true;
    }
    return lastFullSyncAt.secsTo(now) >= qint64(intervalHours) * 3600;
}

void SyncScheduler::onAppLaunched()
{
    runScheduledSync("launch");
}

void SyncScheduler::onAppForegrounded()
{
    runScheduledSync("foreground");
}

void SyncScheduler::requestFullSync()
{
    m_permissionDenied = false;
    startFullSync(now());
}

void SyncScheduler::runScheduledSync(const char* trigger)
{
    if (m_permissionDenied) {
        qWarning() << "[SyncScheduler] Skipping" << trigger
                   << "sync: access to the player was denied";
        return;
    }

    if (m_syncing) {
        qDebug() << "[SyncScheduler] Sync already running, ignoring" << trigger;
        return;
    }

    const QDateTime current = now();
    if (!m_state.librarySeeded
        || shouldRunFullSync(m_state.lastFullSyncAt, current, m_fullSyncIntervalHours)) {
        qDebug() << "[SyncScheduler]" << trigger << "- running full sync, last was"
                 << m_state.lastFullSyncAt;
        startFullSync(current);
    } else {
        qDebug() << "[SyncScheduler]" << trigger << "- checking the current track only";
        runQuickSync();
    }
}

ReconciliationReport SyncScheduler::runQuickSync()
{
    ReconciliationReport report;

    if (m_syncing) {
        qDebug() << "[SyncScheduler] Full sync in progress, quick sync skipped";
        return report;
    }

    if (!m_catalog || !m_database) {
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = "Scheduler is not configured";
        reportFailure(report);
        return report;
    }

    const QDateTime current = now();

    CatalogResult playing = m_catalog->currentlyPlayingTrack();
    if (!playing.ok()) {
        report.error = playing.error;
        report.errorMessage = playing.errorMessage;
        reportFailure(report);
        return report;
    }

    if (playing.tracks.isEmpty()) {
        qDebug() << "[SyncScheduler] Nothing playing, quick sync has nothing to check";
        report.finishedAt = current;
        emit quickSyncFinished(report);
        return report;
    }

    CounterReconciler reconciler(m_database, m_catalog, m_lock);
    report = reconciler.reconcileOne(playing.tracks.first(), current);

    if (report.succeeded()) {
        emit quickSyncFinished(report);
    } else {
        reportFailure(report);
    }
    return report;
}

ReconciliationReport SyncScheduler::runFullSyncNow()
{
    if (m_syncing) {
        m_syncFuture.waitForFinished();
        // Deliver the background result before starting over
        if (m_syncing) {
            finishFullSync(m_syncFuture.result());
        }
    }

    const QDateTime current = now();
    m_seeding = !m_state.librarySeeded;
    m_stopRequested = false;
    setSyncing(true);

    ReconciliationReport report = performFullSync(m_database ? m_database->databasePath() : QString(),
                                                  current);
    finishFullSync(report);
    return report;
}

void SyncScheduler::startFullSync(const QDateTime& current)
{
    if (m_syncing) {
        qDebug() << "[SyncScheduler] Full sync already running";
        return;
    }

    if (!m_database || !m_catalog) {
        ReconciliationReport report;
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = "Scheduler is not configured";
        reportFailure(report);
        return;
    }

    m_seeding = !m_state.librarySeeded;
    m_stopRequested = false;
    setSyncing(true);

    const QString databasePath = m_database->databasePath();

    if (!m_runInBackground) {
        finishFullSync(performFullSync(databasePath, current));
        return;
    }

    m_syncFuture = QtConcurrent::run([this, databasePath, current]() {
        return performFullSync(databasePath, current);
    });
    m_syncWatcher.setFuture(m_syncFuture);
}

ReconciliationReport SyncScheduler::performFullSync(const QString& databasePath, const QDateTime& current)
{
    ReconciliationReport report;

    // SQLite connections are per thread
    const QString connectionName = QString("EncoreSync_%1").arg(quintptr(QThread::currentThreadId()));
    DatabaseManager database(connectionName);

    if (!database.initializeDatabase(databasePath)) {
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = QString("Could not open %1 for syncing").arg(databasePath);
        qCritical() << "[SyncScheduler]" << report.errorMessage;
        return report;
    }

    try {
        CounterReconciler reconciler(&database, m_catalog, m_lock);
        reconciler.setBatchSize(m_batchSize);
        reconciler.setStopFlag(&m_stopRequested);
        connect(&reconciler, &CounterReconciler::progress,
                this, &SyncScheduler::onReconcileProgress);

        report = reconciler.reconcileAll(current);
    } catch (const std::exception& e) {
        qCritical() << "[SyncScheduler] Exception during full sync:" << e.what();
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = QString::fromLocal8Bit(e.what());
    }

    database.close();
    return report;
}

void SyncScheduler::onFullSyncFinished()
{
    if (!m_syncing) {
        return;
    }
    finishFullSync(m_syncWatcher.result());
}

void SyncScheduler::finishFullSync(const ReconciliationReport& report)
{
    const bool wasSeeding = m_seeding;
    m_seeding = false;
    setSyncing(false);

    if (!report.succeeded()) {
        reportFailure(report);
        return;
    }

    if (report.stopped) {
        qDebug() << "[SyncScheduler] Full sync stopped early; it will run again next time";
        return;
    }

    m_state.lastFullSyncAt = report.finishedAt;
    if (wasSeeding) {
        m_state.librarySeeded = true;
        qDebug() << "[SyncScheduler] Library seeded with" << report.tracksCreated << "tracks";
    }

    if (!m_database->saveEngineState(m_state)) {
        qWarning() << "[SyncScheduler] Failed to persist engine state";
    }

    qDebug() << "[SyncScheduler] Full sync finished:" << report.tracksProcessed << "tracks,"
             << report.playFactsCreated << "new plays";
    emit fullSyncFinished(report);
}

void SyncScheduler::reportFailure(const ReconciliationReport& report)
{
    qWarning() << "[SyncScheduler] Sync failed:" << syncErrorToString(report.error)
               << report.errorMessage;

    if (report.error == SyncError::PermissionDenied) {
        m_permissionDenied = true;
        emit permissionDenied();
    }
    emit syncFailed(report.error, report.errorMessage);
}

void SyncScheduler::onReconcileProgress(int current, int total, const QString& title)
{
    if (m_seeding) {
        emit seedingProgress(current, total, title);
    } else {
        emit syncProgress(current, total, title);
    }
}

void SyncScheduler::shutdown()
{
    m_stopRequested = true;
    if (m_syncFuture.isRunning()) {
        qDebug() << "[SyncScheduler] Waiting for the running sync to stop";
        m_syncFuture.waitForFinished();
    }
}

void SyncScheduler::setSyncing(bool syncing)
{
    if (m_syncing != syncing) {
        m_syncing = syncing;
        emit syncingChanged(m_syncing);
    }
}

QDateTime SyncScheduler::now() const
{
    return m_clock();
}

} // namespace Encore
