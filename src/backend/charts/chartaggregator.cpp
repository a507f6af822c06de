#include "chartaggregator.h"

#include <QDebug>
#include <QHash>
#include <QLocale>
#include <QMutex>
#include <QMutexLocker>
#include <algorithm>

#include "../database/databasemanager.h"

namespace Encore {

QString chartPeriodName(ChartPeriod period)
{
    switch (period) {
    case ChartPeriod::AllTime:
        return QStringLiteral("all");
    case ChartPeriod::ThisWeek:
        return QStringLiteral("week");
    case ChartPeriod::ThisMonth:
        return QStringLiteral("month");
    case ChartPeriod::ThisYear:
        return QStringLiteral("year");
    }
    return QStringLiteral("all");
}

bool chartPeriodFromString(const QString& name, ChartPeriod* period)
{
    const QString key = name.trimmed().toLower();
    if (key == "all" || key == "alltime") {
        *period = ChartPeriod::AllTime;
    } else if (key == "week") {
        *period = ChartPeriod::ThisWeek;
    } else if (key == "month") {
        *period = ChartPeriod::ThisMonth;
    } else if (key == "year") {
        *period = ChartPeriod::ThisYear;
    } else {
        return false;
    }
    return true;
}

RankMovement RankMovement::between(int previousRank, int currentRank)
{
    RankMovement movement;
    if (previousRank <= 0) {
        movement.kind = New;
    } else if (previousRank == currentRank) {
        movement.kind = Unchanged;
    } else if (currentRank < previousRank) {
        movement.kind = Up;
        movement.positions = previousRank - currentRank;
    } else {
        movement.kind = Down;
        movement.positions = currentRank - previousRank;
    }
    return movement;
}

QString RankMovement::symbol() const
{
    switch (kind) {
    case New:
        return QStringLiteral("NEW");
    case Up:
        return QString("+%1").arg(positions);
    case Down:
        return QString("-%1").arg(positions);
    case Unchanged:
        return QStringLiteral("=");
    }
    return QString();
}

ChartAggregator::ChartAggregator(DatabaseManager* database, QObject *parent)
    : QObject(parent)
    , m_database(database)
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
{
}

ChartAggregator::~ChartAggregator()
{
}

void ChartAggregator::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

QDateTime ChartAggregator::periodStart(ChartPeriod period, const QDateTime& now)
{
    const QDate today = now.toLocalTime().date();

    QDate start;
    switch (period) {
    case ChartPeriod::AllTime:
        return QDateTime();
    case ChartPeriod::ThisWeek: {
        const int firstDay = QLocale().firstDayOfWeek();
        const int daysIntoWeek = (today.dayOfWeek() - firstDay + 7) % 7;
        start = today.addDays(-daysIntoWeek);
        break;
    }
    case ChartPeriod::ThisMonth:
        start = QDate(today.year(), today.month(), 1);
        break;
    case ChartPeriod::ThisYear:
        start = QDate(today.year(), 1, 1);
        break;
    }

    return start.startOfDay().toUTC();
}

int ChartAggregator::totalPlayCount(const TrackRecord& track)
{
    if (!m_database || !track.isValid()) return 0;
    return track.baselineCounter + m_database->countPlayFacts(track.id);
}

int ChartAggregator::totalPlayCount(int trackId)
{
    if (!m_database) return 0;
    return totalPlayCount(m_database->getTrack(trackId));
}

int ChartAggregator::periodPlayCount(int trackId, const QDateTime& since)
{
    if (!m_database) return 0;
    return m_database->countPlayFacts(trackId, since);
}

int ChartAggregator::periodPlayCount(int trackId, ChartPeriod period)
{
    if (period == ChartPeriod::AllTime) {
        return totalPlayCount(trackId);
    }
    return periodPlayCount(trackId, periodStart(period, now()));
}

PlayBreakdown ChartAggregator::breakdown(int trackId, ChartPeriod period)
{
    PlayBreakdown result;
    if (!m_database) return result;

    const QDateTime since = periodStart(period, now());
    result.live = m_database->countPlayFactsBySource(trackId, PlaySource::Live, since);
    result.counterSync = m_database->countPlayFactsBySource(trackId, PlaySource::CounterSync, since);

    if (period == ChartPeriod::AllTime) {
        result.baseline = m_database->getTrack(trackId).baselineCounter;
    }
    return result;
}

QList<ChartEntry> ChartAggregator::rankedTracks(ChartPeriod period, bool recordRanks)
{
    QList<ChartEntry> chart;
    if (!m_database) return chart;

    const QDateTime since = periodStart(period, now());
    const QHash<int, int> factCounts = m_database->getPlayFactCountsByTrack(since);

    // getAllTracks returns catalog order, which stable_sort keeps for ties
    const QList<TrackRecord> tracks = m_database->getAllTracks();
    for (const TrackRecord& track : tracks) {
        ChartEntry entry;
        entry.track = track;
        entry.playCount = factCounts.value(track.id, 0);
        if (period == ChartPeriod::AllTime) {
            entry.playCount += track.baselineCounter;
        } else if (entry.playCount == 0) {
            continue;
        }
        chart.append(entry);
    }

    std::stable_sort(chart.begin(), chart.end(), [](const ChartEntry& a, const ChartEntry& b) {
        return a.playCount > b.playCount;
    });

    const QString view = chartPeriodName(period);
    const QHash<int, int> previousRanks = m_database->getRanks(view);

    QHash<int, int> currentRanks;
    for (int i = 0; i < chart.size(); ++i) {
        ChartEntry& entry = chart[i];
        entry.rank = i + 1;
        entry.previousRank = previousRanks.value(entry.track.id, 0);
        entry.movement = RankMovement::between(entry.previousRank, entry.rank);
        currentRanks.insert(entry.track.id, entry.rank);
    }

    if (!recordRanks) {
        return chart;
    }

    bool saved = false;
    {
        QMutexLocker locker(m_writeLock);
        saved = m_database->saveRanks(view, currentRanks);
    }
    if (!saved) {
        qWarning() << "[ChartAggregator] Failed to store ranks for" << view;
        return chart;
    }

    // The very first chart has nothing to move against
    if (previousRanks.isEmpty()) {
        return chart;
    }

    for (const ChartEntry& entry : chart) {
        if (entry.previousRank != entry.rank) {
            emit rankChanged(entry.track.id, entry.previousRank, entry.rank, period);
        }
    }

    return chart;
}

QDateTime ChartAggregator::now() const
{
    return m_clock();
}

} // namespace Encore
