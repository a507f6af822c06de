#ifndef CHARTAGGREGATOR_H
#define CHARTAGGREGATOR_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <functional>

#include "../library/trackrecord.h"

class QMutex;

namespace Encore {

class DatabaseManager;

enum class ChartPeriod {
    AllTime,
    ThisWeek,
    ThisMonth,
    ThisYear
};

// Short names used for stored ranks and on the command line
QString chartPeriodName(ChartPeriod period);
bool chartPeriodFromString(const QString& name, ChartPeriod* period);

struct RankMovement {
    enum Kind {
        New,
        Up,
        Down,
        Unchanged
    };

    Kind kind = New;
    int positions = 0;

    // previousRank <= 0 means the track was not ranked before
    static RankMovement between(int previousRank, int currentRank);

    // "NEW", "+2", "-1" or "="
    QString symbol() const;

    bool operator==(const RankMovement& other) const {
        return kind == other.kind && positions == other.positions;
    }
    bool operator!=(const RankMovement& other) const { return !(*this == other); }
};

struct ChartEntry {
    TrackRecord track;
    int rank = 0;
    int playCount = 0;
    int previousRank = 0;  // 0 when unranked before
    RankMovement movement;
};

struct PlayBreakdown {
    int baseline = 0;      // all-time only
    int live = 0;
    int counterSync = 0;

    int total() const { return baseline + live + counterSync; }
};

// Folds the play ledger into counts and ranked charts.
class ChartAggregator : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    explicit ChartAggregator(DatabaseManager* database, QObject *parent = nullptr);
    ~ChartAggregator();

    void setClock(Clock clock);

    // Held while ranks are written, so the write never commits inside a
    // reconciliation batch running on another connection
    void setWriteLock(QMutex* lock) { m_writeLock = lock; }

    // Start of the current local week, month or year; invalid for AllTime
    static QDateTime periodStart(ChartPeriod period, const QDateTime& now);

    // baseline + every play fact
    int totalPlayCount(const TrackRecord& track);
    int totalPlayCount(int trackId);

    // Play facts since the given time; the baseline has no date and never counts
    int periodPlayCount(int trackId, const QDateTime& since);
    int periodPlayCount(int trackId, ChartPeriod period);

    PlayBreakdown breakdown(int trackId, ChartPeriod period);

    // Ranked by count, ties in catalog order. Period charts leave out tracks
    // without plays in the period. With recordRanks the ranks become the
    // reference for the next movement and changes are signalled.
    QList<ChartEntry> rankedTracks(ChartPeriod period, bool recordRanks = true);

signals:
    void rankChanged(int trackId, int oldRank, int newRank, Encore::ChartPeriod period);

private:
    QDateTime now() const;

    DatabaseManager* m_database;
    QMutex* m_writeLock = nullptr;
    Clock m_clock;
};

} // namespace Encore

Q_DECLARE_METATYPE(Encore::ChartPeriod)
Q_DECLARE_METATYPE(Encore::ChartEntry)

#endif // CHARTAGGREGATOR_H
