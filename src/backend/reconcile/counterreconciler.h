#ifndef COUNTERRECONCILER_H
#define COUNTERRECONCILER_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QVariantMap>
#include <atomic>
#include <random>

#include "../catalog/mediacatalog.h"
#include "../library/playfact.h"
#include "../library/trackrecord.h"
#include "../sync/syncerror.h"

class QMutex;

namespace Encore {

class DatabaseManager;

struct ReconciliationReport {
    int tracksProcessed = 0;
    int tracksCreated = 0;
    int playFactsCreated = 0;
    int liveFactsAbsorbed = 0;  // counter increments already recorded as live plays
    int batchesCommitted = 0;
    bool stopped = false;       // a stop request ended the pass early
    SyncError error = SyncError::None;
    QString errorMessage;
    QDateTime finishedAt;

    bool succeeded() const { return error == SyncError::None; }
};

// Folds system play counter deltas into the play ledger.
//
// Each track is compared against the last counter value accounted for. An
// increase becomes CounterSync play facts spread over the time since the
// previous comparison, minus increments already recorded as live plays. A
// decrease (external reset) only moves the reference value. A track seen for
// the first time keeps its counter as baseline and gets no facts.
class CounterReconciler : public QObject
{
    Q_OBJECT

public:
    CounterReconciler(DatabaseManager* database, MediaCatalog* catalog,
                      QMutex* lock = nullptr, QObject *parent = nullptr);
    ~CounterReconciler();

    void setBatchSize(int batchSize);
    int batchSize() const { return m_batchSize; }

    // Makes timestamp spreading reproducible
    void setSeed(quint32 seed);

    // Checked between batches; committed batches stay committed
    void setStopFlag(const std::atomic<bool>* stopFlag) { m_stopFlag = stopFlag; }

    ReconciliationReport reconcileAll(const QDateTime& now);
    ReconciliationReport reconcileOne(const QString& persistentId, const QDateTime& now);
    ReconciliationReport reconcileOne(const CatalogEntry& entry, const QDateTime& now);

    static constexpr int DEFAULT_BATCH_SIZE = 100;

signals:
    void progress(int current, int total, const QString& title);

private:
    ReconciliationReport reconcileEntries(const QList<CatalogEntry>& entries, const QDateTime& now);
    bool reconcileEntry(const CatalogEntry& entry, const QDateTime& now, ReconciliationReport* report);
    bool createTrack(const CatalogEntry& entry, const QDateTime& now, ReconciliationReport* report);
    QList<PlayFact> spreadPlayFacts(int trackId, int count,
                                    const QDateTime& windowStart, const QDateTime& windowEnd);
    static void addMetadataChanges(const TrackRecord& track, const CatalogEntry& entry,
                                   QVariantMap* changes);

    DatabaseManager* m_database;
    MediaCatalog* m_catalog;
    QMutex* m_lock;
    int m_batchSize = DEFAULT_BATCH_SIZE;
    const std::atomic<bool>* m_stopFlag = nullptr;
    std::mt19937 m_rng;
};

} // namespace Encore

Q_DECLARE_METATYPE(Encore::ReconciliationReport)

#endif // COUNTERRECONCILER_H
