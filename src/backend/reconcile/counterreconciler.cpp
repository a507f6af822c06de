#include "counterreconciler.h"

#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <algorithm>

#include "../database/databasemanager.h"

namespace Encore {

CounterReconciler::CounterReconciler(DatabaseManager* database, MediaCatalog* catalog,
                                     QMutex* lock, QObject *parent)
    : QObject(parent)
    , m_database(database)
    , m_catalog(catalog)
    , m_lock(lock)
{
    std::random_device rd;
    m_rng.seed(rd());
}

CounterReconciler::~CounterReconciler()
{
}

void CounterReconciler::setBatchSize(int batchSize)
{
    m_batchSize = qMax(1, batchSize);
}

void CounterReconciler::setSeed(quint32 seed)
{
    m_rng.seed(seed);
}

ReconciliationReport CounterReconciler::reconcileAll(const QDateTime& now)
{
    ReconciliationReport report;

    if (!m_database || !m_catalog) {
        qWarning() << "[CounterReconciler] Missing database or catalog";
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = "Reconciler is not configured";
        return report;
    }

    CatalogResult catalog = m_catalog->enumerateTracks();
    if (!catalog.ok()) {
        qWarning() << "[CounterReconciler] Catalog enumeration failed:"
                   << syncErrorToString(catalog.error) << catalog.errorMessage;
        report.error = catalog.error;
        report.errorMessage = catalog.errorMessage;
        return report;
    }

    qDebug() << "[CounterReconciler] Reconciling" << catalog.tracks.size() << "catalog tracks";
    return reconcileEntries(catalog.tracks, now);
}

ReconciliationReport CounterReconciler::reconcileOne(const QString& persistentId, const QDateTime& now)
{
    ReconciliationReport report;

    if (!m_database || !m_catalog) {
        qWarning() << "[CounterReconciler] Missing database or catalog";
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = "Reconciler is not configured";
        return report;
    }

    CatalogResult lookup = m_catalog->lookupTrack(persistentId);
    if (!lookup.ok()) {
        report.error = lookup.error;
        report.errorMessage = lookup.errorMessage;
        return report;
    }

    if (lookup.tracks.isEmpty()) {
        qDebug() << "[CounterReconciler] Track" << persistentId << "is no longer in the catalog";
        report.finishedAt = now;
        return report;
    }

    return reconcileOne(lookup.tracks.first(), now);
}

ReconciliationReport CounterReconciler::reconcileOne(const CatalogEntry& entry, const QDateTime& now)
{
    if (!m_database) {
        ReconciliationReport report;
        report.error = SyncError::PersistenceFailure;
        report.errorMessage = "Reconciler is not configured";
        return report;
    }
    return reconcileEntries(QList<CatalogEntry>{entry}, now);
}

ReconciliationReport CounterReconciler::reconcileEntries(const QList<CatalogEntry>& entries,
                                                         const QDateTime& now)
{
    ReconciliationReport report;
    const int total = entries.size();

    for (int start = 0; start < total; start += m_batchSize) {
        if (m_stopFlag && m_stopFlag->load()) {
            qDebug() << "[CounterReconciler] Stop requested after" << report.tracksProcessed << "tracks";
            report.stopped = true;
            break;
        }

        const int end = qMin(start + m_batchSize, total);

        // A live play for the same track must not interleave with its batch
        QMutexLocker locker(m_lock);

        if (!m_database->beginTransaction()) {
            qWarning() << "[CounterReconciler] Failed to start transaction";
            report.error = SyncError::PersistenceFailure;
            report.errorMessage = "Could not start a transaction";
            break;
        }

        int batchProcessed = 0;
        int batchCreated = 0;
        int batchFacts = 0;
        int batchAbsorbed = 0;
        bool batchOk = true;

        for (int i = start; i < end; ++i) {
            const CatalogEntry& entry = entries.at(i);
            if (!entry.isValid()) {
                continue;
            }

            ReconciliationReport entryReport;
            if (!reconcileEntry(entry, now, &entryReport)) {
                batchOk = false;
                break;
            }
            ++batchProcessed;
            batchCreated += entryReport.tracksCreated;
            batchFacts += entryReport.playFactsCreated;
            batchAbsorbed += entryReport.liveFactsAbsorbed;
        }

        if (!batchOk || !m_database->commitTransaction()) {
            m_database->rollbackTransaction();
            qWarning() << "[CounterReconciler] Batch" << (start / m_batchSize) + 1
                       << "rolled back; later tracks are left for the next sync";
            report.error = SyncError::PersistenceFailure;
            report.errorMessage = "A reconciliation batch did not commit";
            break;
        }

        report.tracksProcessed += batchProcessed;
        report.tracksCreated += batchCreated;
        report.playFactsCreated += batchFacts;
        report.liveFactsAbsorbed += batchAbsorbed;
        report.batchesCommitted++;

        if (m_lock) {
            locker.unlock();
        }

        emit progress(end, total, entries.at(end - 1).title);
    }

    report.finishedAt = now;

    qDebug() << "[CounterReconciler] Processed" << report.tracksProcessed << "tracks,"
             << report.tracksCreated << "new," << report.playFactsCreated << "play facts,"
             << report.liveFactsAbsorbed << "absorbed live plays";

    return report;
}

bool CounterReconciler::reconcileEntry(const CatalogEntry& entry, const QDateTime& now,
                                       ReconciliationReport* report)
{
    TrackRecord track = m_database->getTrackByPersistentId(entry.persistentId);
    if (!track.isValid()) {
        return createTrack(entry, now, report);
    }

    QVariantMap changes;
    addMetadataChanges(track, entry, &changes);

    if (!entry.playCountKnown) {
        // Nothing to compare; keep the metadata current
        return changes.isEmpty() || m_database->updateTrack(track.id, changes);
    }

    const int counter = entry.playCount;

    if (!track.counterKnown) {
        // First counter for a track that was created from a live play.
        // Everything the counter holds beyond our facts predates tracking.
        const int recorded = m_database->countPlayFacts(track.id);
        changes["baselineCounter"] = qMax(0, counter - recorded);
        changes["lastSeenCounter"] = counter;
        changes["pendingLivePlays"] = 0;
        changes["lastReconciledAt"] = now;

        qDebug() << "[CounterReconciler] First counter for" << entry.title << ":" << counter
                 << "- baseline" << qMax(0, counter - recorded);
        return m_database->updateTrack(track.id, changes);
    }

    const int delta = counter - track.lastSeenCounter;

    if (delta == 0) {
        return changes.isEmpty() || m_database->updateTrack(track.id, changes);
    }

    if (delta < 0) {
        qDebug() << "[CounterReconciler] Counter for" << entry.title << "went from"
                 << track.lastSeenCounter << "to" << counter << "- treating as reset";
        changes["lastSeenCounter"] = counter;
        changes["pendingLivePlays"] = 0;
        changes["lastReconciledAt"] = now;
        return m_database->updateTrack(track.id, changes);
    }

    const int absorbed = qMin(delta, track.pendingLivePlays);
    const int newFacts = delta - absorbed;

    if (newFacts > 0) {
        QList<PlayFact> facts = spreadPlayFacts(track.id, newFacts, track.lastReconciledAt, now);
        if (!m_database->insertPlayFacts(facts)) {
            return false;
        }
    }

    changes["lastSeenCounter"] = counter;
    changes["pendingLivePlays"] = track.pendingLivePlays - absorbed;
    changes["lastReconciledAt"] = now;
    if (!m_database->updateTrack(track.id, changes)) {
        return false;
    }

    qDebug() << "[CounterReconciler]" << entry.title << "counter" << track.lastSeenCounter
             << "->" << counter << ":" << newFacts << "new plays," << absorbed << "already live";

    report->playFactsCreated += newFacts;
    report->liveFactsAbsorbed += absorbed;
    return true;
}

bool CounterReconciler::createTrack(const CatalogEntry& entry, const QDateTime& now,
                                    ReconciliationReport* report)
{
    TrackRecord track;
    track.persistentId = entry.persistentId;
    track.title = entry.title;
    track.artist = entry.artist;
    track.album = entry.album;
    track.duration = entry.durationSeconds > 0 ? entry.durationSeconds : 0.0;
    // Historical plays live in the baseline only; no facts are invented for them
    track.counterKnown = entry.playCountKnown;
    track.baselineCounter = entry.playCountKnown ? entry.playCount : 0;
    track.lastSeenCounter = track.baselineCounter;
    track.pendingLivePlays = 0;
    track.lastReconciledAt = now;
    track.createdAt = now;

    if (m_database->insertTrack(track) <= 0) {
        return false;
    }

    report->tracksCreated++;
    return true;
}

QList<PlayFact> CounterReconciler::spreadPlayFacts(int trackId, int count,
                                                   const QDateTime& windowStart,
                                                   const QDateTime& windowEnd)
{
    QList<PlayFact> facts;
    facts.reserve(count);

    const qint64 windowMs = windowStart.isValid() ? windowStart.msecsTo(windowEnd) : 0;

    for (int i = 0; i < count; ++i) {
        PlayFact fact;
        fact.trackId = trackId;
        fact.source = PlaySource::CounterSync;

        if (windowMs <= 0) {
            fact.timestamp = windowEnd;
        } else {
            // Offset in [0, window) keeps the timestamp inside (start, end]
            std::uniform_int_distribution<qint64> offset(0, windowMs - 1);
            fact.timestamp = windowEnd.addMSecs(-offset(m_rng));
        }
        facts.append(fact);
    }

    std::sort(facts.begin(), facts.end(), [](const PlayFact& a, const PlayFact& b) {
        return a.timestamp < b.timestamp;
    });

    return facts;
}

void CounterReconciler::addMetadataChanges(const TrackRecord& track, const CatalogEntry& entry,
                                           QVariantMap* changes)
{
    if (!entry.title.isEmpty() && entry.title != track.title) {
        (*changes)["title"] = entry.title;
    }
    if (!entry.artist.isEmpty() && entry.artist != track.artist) {
        (*changes)["artist"] = entry.artist;
    }
    if (!entry.album.isEmpty() && entry.album != track.album) {
        (*changes)["album"] = entry.album;
    }
    if (entry.durationSeconds > 0 && !qFuzzyCompare(entry.durationSeconds, track.duration)) {
        (*changes)["duration"] = entry.durationSeconds;
    }
}

} // namespace Encore
