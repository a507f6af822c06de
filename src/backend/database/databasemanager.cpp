#include "databasemanager.h"
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <QVariant>
#include <QStringList>

namespace Encore {

const QString DatabaseManager::DB_CONNECTION_NAME = "EncorePlayLedger";

namespace {

QVariant toStoredTime(const QDateTime& time)
{
    return time.isValid() ? QVariant(time.toMSecsSinceEpoch()) : QVariant();
}

QDateTime fromStoredTime(const QVariant& value)
{
    if (value.isNull()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong(), Qt::UTC);
}

QVariant optionalValue(const std::optional<double>& value)
{
    return value.has_value() ? QVariant(*value) : QVariant();
}

} // namespace

DatabaseManager::DatabaseManager(QObject *parent)
    : DatabaseManager(DB_CONNECTION_NAME, parent)
{
}

DatabaseManager::DatabaseManager(const QString& connectionName, QObject *parent)
    : QObject(parent)
    , m_connectionName(connectionName)
{
}

DatabaseManager::~DatabaseManager()
{
    close();
}

bool DatabaseManager::initializeDatabase(const QString& dbPath)
{
    QString path = dbPath;
    if (path.isEmpty()) {
        path = defaultDatabasePath();
    }

    qDebug() << "[DatabaseManager] Opening" << path << "as" << m_connectionName;

    // Ensure directory exists
    QDir dir = QFileInfo(path).dir();
    if (!dir.exists()) {
        qDebug() << "[DatabaseManager] Creating directory:" << dir.path();
        dir.mkpath(".");
    }

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(path);
    m_databasePath = path;

    if (!m_db.open()) {
        qCritical() << "[DatabaseManager] Failed to open database:" << m_db.lastError().text();
        emit databaseError(m_db.lastError().text());
        return false;
    }

    applyPragmas();

    if (!createTables()) {
        return false;
    }

    if (!createIndexes()) {
        return false;
    }

    qDebug() << "[DatabaseManager] Database initialized at:" << path;
    return true;
}

void DatabaseManager::applyPragmas()
{
    QSqlQuery query(m_db);
    query.exec("PRAGMA foreign_keys = ON");
    query.exec("PRAGMA journal_mode = WAL");
    query.exec("PRAGMA synchronous = NORMAL");
    query.exec("PRAGMA temp_store = MEMORY");
    // Worker connections wait for the main connection instead of failing with SQLITE_BUSY
    query.exec("PRAGMA busy_timeout = 5000");
}

bool DatabaseManager::isOpen() const
{
    return m_db.isOpen();
}

void DatabaseManager::close()
{
    if (m_db.isOpen()) {
        m_db.close();
    }

    // Clear the database object so no query keeps the connection alive
    m_db = QSqlDatabase();

    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool DatabaseManager::createTables()
{
    QSqlQuery query(m_db);

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "version INTEGER PRIMARY KEY,"
        "applied_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
        ")")) {
        logError("Create schema_version table", query);
        return false;
    }

    int currentVersion = 0;
    if (query.exec("SELECT MAX(version) FROM schema_version") && query.next()) {
        currentVersion = query.value(0).toInt();
    }

    // Tracks table; the row id is the catalog order used to break chart ties
    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS tracks ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "persistent_id TEXT NOT NULL UNIQUE,"
        "title TEXT,"
        "artist TEXT,"
        "album TEXT,"
        "duration REAL DEFAULT 0," // in seconds
        "baseline_counter INTEGER NOT NULL DEFAULT 0,"
        "last_seen_counter INTEGER,"
        "last_reconciled_at INTEGER NOT NULL,"
        "created_at INTEGER NOT NULL"
        ")")) {
        logError("Create tracks table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS play_facts ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "track_id INTEGER NOT NULL,"
        "played_at INTEGER NOT NULL,"
        "source TEXT NOT NULL CHECK (source IN ('live', 'counter_sync')),"
        "listened_duration REAL,"
        "track_duration REAL,"
        "completion_ratio REAL,"
        "FOREIGN KEY (track_id) REFERENCES tracks(id) ON DELETE CASCADE"
        ")")) {
        logError("Create play_facts table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS chart_ranks ("
        "track_id INTEGER NOT NULL,"
        "view TEXT NOT NULL,"
        "rank INTEGER NOT NULL,"
        "PRIMARY KEY (track_id, view),"
        "FOREIGN KEY (track_id) REFERENCES tracks(id) ON DELETE CASCADE"
        ")")) {
        logError("Create chart_ranks table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS engine_state ("
        "key TEXT PRIMARY KEY,"
        "value TEXT"
        ")")) {
        logError("Create engine_state table", query);
        return false;
    }

    return applyMigrations(currentVersion);
}

bool DatabaseManager::applyMigrations(int currentVersion)
{
    QSqlQuery query(m_db);

    // Migration 1: live plays awaiting absorption by the system counter
    if (currentVersion < 1) {
        qDebug() << "[DatabaseManager] Applying migration 1: pending_live_plays column";

        query.exec("PRAGMA table_info(tracks)");
        bool hasPendingColumn = false;
        while (query.next()) {
            if (query.value(1).toString() == "pending_live_plays") {
                hasPendingColumn = true;
                break;
            }
        }

        if (!hasPendingColumn) {
            if (!query.exec("ALTER TABLE tracks ADD COLUMN pending_live_plays INTEGER NOT NULL DEFAULT 0")) {
                logError("Add pending_live_plays column", query);
                return false;
            }
        }

        query.prepare("INSERT INTO schema_version (version) VALUES (:version)");
        query.bindValue(":version", 1);
        if (!query.exec()) {
            logError("Record migration 1", query);
            return false;
        }
    }

    return true;
}

bool DatabaseManager::createIndexes()
{
    QSqlQuery query(m_db);

    if (!query.exec("CREATE INDEX IF NOT EXISTS idx_play_facts_track ON play_facts(track_id, played_at)")) {
        logError("Create play_facts track index", query);
        return false;
    }
    if (!query.exec("CREATE INDEX IF NOT EXISTS idx_play_facts_time ON play_facts(played_at)")) {
        logError("Create play_facts time index", query);
        return false;
    }
    query.exec("CREATE INDEX IF NOT EXISTS idx_chart_ranks_view ON chart_ranks(view)");

    return true;
}

int DatabaseManager::insertTrack(const TrackRecord& track)
{
    if (!m_db.isOpen()) return 0;

    const QDateTime now = QDateTime::currentDateTimeUtc();

    QSqlQuery query(m_db);
    query.prepare(
        "INSERT INTO tracks (persistent_id, title, artist, album, duration, "
        "baseline_counter, last_seen_counter, pending_live_plays, last_reconciled_at, created_at) "
        "VALUES (:persistent_id, :title, :artist, :album, :duration, "
        ":baseline_counter, :last_seen_counter, :pending_live_plays, :last_reconciled_at, :created_at)"
    );

    query.bindValue(":persistent_id", track.persistentId);
    query.bindValue(":title", track.title);
    query.bindValue(":artist", track.artist);
    query.bindValue(":album", track.album);
    query.bindValue(":duration", track.duration > 0 ? track.duration : 0.0);
    query.bindValue(":baseline_counter", track.baselineCounter);
    query.bindValue(":last_seen_counter", track.counterKnown ? QVariant(track.lastSeenCounter) : QVariant());
    query.bindValue(":pending_live_plays", track.pendingLivePlays);
    query.bindValue(":last_reconciled_at", toStoredTime(track.lastReconciledAt.isValid() ? track.lastReconciledAt : now));
    query.bindValue(":created_at", toStoredTime(track.createdAt.isValid() ? track.createdAt : now));

    if (!query.exec()) {
        logError("Insert track", query);
        return 0;
    }

    return query.lastInsertId().toInt();
}

bool DatabaseManager::updateTrack(int trackId, const QVariantMap& trackData)
{
    if (!m_db.isOpen()) return false;

    // Build dynamic update query based on provided fields
    QStringList setClauses;
    QVariantMap bindValues;

    if (trackData.contains("title")) {
        setClauses << "title = :title";
        bindValues[":title"] = trackData.value("title");
    }

    if (trackData.contains("artist")) {
        setClauses << "artist = :artist";
        bindValues[":artist"] = trackData.value("artist");
    }

    if (trackData.contains("album")) {
        setClauses << "album = :album";
        bindValues[":album"] = trackData.value("album");
    }

    if (trackData.contains("duration")) {
        double duration = trackData.value("duration").toDouble();
        setClauses << "duration = :duration";
        bindValues[":duration"] = duration > 0 ? duration : 0.0;
    }

    if (trackData.contains("baselineCounter")) {
        setClauses << "baseline_counter = :baseline_counter";
        bindValues[":baseline_counter"] = qMax(0, trackData.value("baselineCounter").toInt());
    }

    if (trackData.contains("lastSeenCounter")) {
        const QVariant lastSeen = trackData.value("lastSeenCounter");
        setClauses << "last_seen_counter = :last_seen_counter";
        bindValues[":last_seen_counter"] = lastSeen.isNull() ? QVariant() : QVariant(lastSeen.toInt());
    }

    if (trackData.contains("pendingLivePlays")) {
        setClauses << "pending_live_plays = :pending_live_plays";
        bindValues[":pending_live_plays"] = qMax(0, trackData.value("pendingLivePlays").toInt());
    }

    if (trackData.contains("lastReconciledAt")) {
        setClauses << "last_reconciled_at = :last_reconciled_at";
        bindValues[":last_reconciled_at"] = toStoredTime(trackData.value("lastReconciledAt").toDateTime());
    }

    if (setClauses.isEmpty()) {
        return true; // Nothing to update
    }

    QString sql = QString("UPDATE tracks SET %1 WHERE id = :id").arg(setClauses.join(", "));

    QSqlQuery query(m_db);
    query.prepare(sql);
    query.bindValue(":id", trackId);

    for (auto it = bindValues.begin(); it != bindValues.end(); ++it) {
        query.bindValue(it.key(), it.value());
    }

    if (!query.exec()) {
        logError("Update track", query);
        return false;
    }

    return true;
}

bool DatabaseManager::deleteTrack(int trackId)
{
    if (!m_db.isOpen()) return false;

    QSqlQuery query(m_db);
    query.prepare("DELETE FROM tracks WHERE id = :id");
    query.bindValue(":id", trackId);

    if (!query.exec()) {
        logError("Delete track", query);
        return false;
    }

    return true;
}

QVariantMap DatabaseManager::trackRowToMap(const QSqlQuery& query) const
{
    QVariantMap track;
    track["id"] = query.value("id");
    track["persistentId"] = query.value("persistent_id");
    track["title"] = query.value("title");
    track["artist"] = query.value("artist");
    track["album"] = query.value("album");
    track["duration"] = query.value("duration");
    track["baselineCounter"] = query.value("baseline_counter");
    const QVariant lastSeen = query.value("last_seen_counter");
    track["lastSeenCounter"] = lastSeen.isNull() ? QVariant() : lastSeen;
    track["pendingLivePlays"] = query.value("pending_live_plays");
    track["lastReconciledAt"] = fromStoredTime(query.value("last_reconciled_at"));
    track["createdAt"] = fromStoredTime(query.value("created_at"));
    return track;
}

TrackRecord DatabaseManager::getTrack(int trackId)
{
    if (!m_db.isOpen()) return TrackRecord();

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM tracks WHERE id = :id");
    query.bindValue(":id", trackId);

    if (!query.exec()) {
        logError("Get track", query);
        return TrackRecord();
    }

    if (query.next()) {
        return TrackRecord::fromVariantMap(trackRowToMap(query));
    }
    return TrackRecord();
}

TrackRecord DatabaseManager::getTrackByPersistentId(const QString& persistentId)
{
    if (!m_db.isOpen()) return TrackRecord();

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM tracks WHERE persistent_id = :persistent_id");
    query.bindValue(":persistent_id", persistentId);

    if (!query.exec()) {
        logError("Get track by persistent id", query);
        return TrackRecord();
    }

    if (query.next()) {
        return TrackRecord::fromVariantMap(trackRowToMap(query));
    }
    return TrackRecord();
}

QList<TrackRecord> DatabaseManager::getAllTracks()
{
    QList<TrackRecord> tracks;
    if (!m_db.isOpen()) {
        qWarning() << "[DatabaseManager::getAllTracks] Database is not open!";
        return tracks;
    }

    QSqlQuery query(m_db);
    if (!query.exec("SELECT * FROM tracks ORDER BY id")) {
        logError("Get all tracks", query);
        return tracks;
    }

    while (query.next()) {
        tracks.append(TrackRecord::fromVariantMap(trackRowToMap(query)));
    }
    return tracks;
}

int DatabaseManager::getTotalTracks()
{
    if (!m_db.isOpen()) return 0;

    QSqlQuery query(m_db);
    if (!query.exec("SELECT COUNT(*) FROM tracks")) {
        qWarning() << "[DatabaseManager] Failed to get track count:" << query.lastError().text();
        return 0;
    }

    if (query.next()) {
        return query.value(0).toInt();
    }
    return 0;
}

bool DatabaseManager::bindAndExecPlayFact(QSqlQuery& query, const PlayFact& fact)
{
    query.bindValue(":track_id", fact.trackId);
    query.bindValue(":played_at", toStoredTime(fact.timestamp));
    query.bindValue(":source", playSourceToString(fact.source));
    query.bindValue(":listened_duration", optionalValue(fact.listenedDuration));
    query.bindValue(":track_duration", optionalValue(fact.trackDurationAtPlay));
    query.bindValue(":completion_ratio", optionalValue(fact.completionRatio));
    return query.exec();
}

qint64 DatabaseManager::insertPlayFact(const PlayFact& fact)
{
    if (!m_db.isOpen()) return 0;

    if (!fact.isValid()) {
        qWarning() << "[DatabaseManager] Refusing play fact without track or timestamp";
        return 0;
    }

    QSqlQuery query(m_db);
    query.prepare(
        "INSERT INTO play_facts (track_id, played_at, source, listened_duration, track_duration, completion_ratio) "
        "VALUES (:track_id, :played_at, :source, :listened_duration, :track_duration, :completion_ratio)"
    );

    if (!bindAndExecPlayFact(query, fact)) {
        logError("Insert play fact", query);
        return 0;
    }

    return query.lastInsertId().toLongLong();
}

bool DatabaseManager::insertPlayFacts(const QList<PlayFact>& facts)
{
    if (!m_db.isOpen()) return false;
    if (facts.isEmpty()) return true;

    QSqlQuery query(m_db);
    query.prepare(
        "INSERT INTO play_facts (track_id, played_at, source, listened_duration, track_duration, completion_ratio) "
        "VALUES (:track_id, :played_at, :source, :listened_duration, :track_duration, :completion_ratio)"
    );

    for (const PlayFact& fact : facts) {
        if (!fact.isValid()) {
            qWarning() << "[DatabaseManager] Refusing play fact without track or timestamp";
            return false;
        }
        if (!bindAndExecPlayFact(query, fact)) {
            logError("Insert play fact batch", query);
            return false;
        }
    }
    return true;
}

PlayFact DatabaseManager::playFactFromRow(const QSqlQuery& query) const
{
    PlayFact fact;
    fact.id = query.value("id").toLongLong();
    fact.trackId = query.value("track_id").toInt();
    fact.timestamp = fromStoredTime(query.value("played_at"));
    PlaySource source = PlaySource::Live;
    if (playSourceFromString(query.value("source").toString(), &source)) {
        fact.source = source;
    }
    if (!query.value("listened_duration").isNull()) {
        fact.listenedDuration = query.value("listened_duration").toDouble();
    }
    if (!query.value("track_duration").isNull()) {
        fact.trackDurationAtPlay = query.value("track_duration").toDouble();
    }
    if (!query.value("completion_ratio").isNull()) {
        fact.completionRatio = query.value("completion_ratio").toDouble();
    }
    return fact;
}

QList<PlayFact> DatabaseManager::getPlayFacts(int trackId, const QDateTime& from, const QDateTime& to)
{
    QList<PlayFact> facts;
    if (!m_db.isOpen()) return facts;

    QString sql = "SELECT * FROM play_facts WHERE 1 = 1";
    if (trackId > 0) {
        sql += " AND track_id = :track_id";
    }
    if (from.isValid()) {
        sql += " AND played_at >= :from";
    }
    if (to.isValid()) {
        sql += " AND played_at <= :to";
    }
    sql += " ORDER BY played_at, id";

    QSqlQuery query(m_db);
    query.prepare(sql);
    if (trackId > 0) {
        query.bindValue(":track_id", trackId);
    }
    if (from.isValid()) {
        query.bindValue(":from", toStoredTime(from));
    }
    if (to.isValid()) {
        query.bindValue(":to", toStoredTime(to));
    }

    if (!query.exec()) {
        logError("Get play facts", query);
        return facts;
    }

    while (query.next()) {
        facts.append(playFactFromRow(query));
    }
    return facts;
}

int DatabaseManager::countPlayFacts(int trackId, const QDateTime& since)
{
    if (!m_db.isOpen()) return 0;

    QString sql = "SELECT COUNT(*) FROM play_facts WHERE track_id = :track_id";
    if (since.isValid()) {
        sql += " AND played_at >= :since";
    }

    QSqlQuery query(m_db);
    query.prepare(sql);
    query.bindValue(":track_id", trackId);
    if (since.isValid()) {
        query.bindValue(":since", toStoredTime(since));
    }

    if (query.exec() && query.next()) {
        return query.value(0).toInt();
    }

    logError("Count play facts", query);
    return 0;
}

int DatabaseManager::countPlayFactsBySource(int trackId, PlaySource source, const QDateTime& since)
{
    if (!m_db.isOpen()) return 0;

    QString sql = "SELECT COUNT(*) FROM play_facts WHERE track_id = :track_id AND source = :source";
    if (since.isValid()) {
        sql += " AND played_at >= :since";
    }

    QSqlQuery query(m_db);
    query.prepare(sql);
    query.bindValue(":track_id", trackId);
    query.bindValue(":source", playSourceToString(source));
    if (since.isValid()) {
        query.bindValue(":since", toStoredTime(since));
    }

    if (query.exec() && query.next()) {
        return query.value(0).toInt();
    }

    logError("Count play facts by source", query);
    return 0;
}

QHash<int, int> DatabaseManager::getPlayFactCountsByTrack(const QDateTime& since)
{
    QHash<int, int> counts;
    if (!m_db.isOpen()) return counts;

    QString sql = "SELECT track_id, COUNT(*) FROM play_facts";
    if (since.isValid()) {
        sql += " WHERE played_at >= :since";
    }
    sql += " GROUP BY track_id";

    QSqlQuery query(m_db);
    query.prepare(sql);
    if (since.isValid()) {
        query.bindValue(":since", toStoredTime(since));
    }

    if (!query.exec()) {
        logError("Get play fact counts", query);
        return counts;
    }

    while (query.next()) {
        counts.insert(query.value(0).toInt(), query.value(1).toInt());
    }
    return counts;
}

int DatabaseManager::getTotalPlayFacts()
{
    if (!m_db.isOpen()) return 0;

    QSqlQuery query(m_db);
    if (query.exec("SELECT COUNT(*) FROM play_facts") && query.next()) {
        return query.value(0).toInt();
    }

    logError("Count all play facts", query);
    return 0;
}

QHash<int, int> DatabaseManager::getRanks(const QString& view)
{
    QHash<int, int> ranks;
    if (!m_db.isOpen()) return ranks;

    QSqlQuery query(m_db);
    query.prepare("SELECT track_id, rank FROM chart_ranks WHERE view = :view");
    query.bindValue(":view", view);

    if (!query.exec()) {
        logError("Get ranks", query);
        return ranks;
    }

    while (query.next()) {
        ranks.insert(query.value(0).toInt(), query.value(1).toInt());
    }
    return ranks;
}

bool DatabaseManager::saveRanks(const QString& view, const QHash<int, int>& ranks)
{
    if (!m_db.isOpen()) return false;

    if (!m_db.transaction()) {
        qWarning() << "[DatabaseManager] Failed to start transaction for saveRanks";
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare("DELETE FROM chart_ranks WHERE view = :view");
    query.bindValue(":view", view);
    if (!query.exec()) {
        logError("saveRanks - clear view", query);
        m_db.rollback();
        return false;
    }

    query.prepare("INSERT INTO chart_ranks (track_id, view, rank) VALUES (:track_id, :view, :rank)");
    for (auto it = ranks.constBegin(); it != ranks.constEnd(); ++it) {
        query.bindValue(":track_id", it.key());
        query.bindValue(":view", view);
        query.bindValue(":rank", it.value());
        if (!query.exec()) {
            logError("saveRanks - insert rank", query);
            m_db.rollback();
            return false;
        }
    }

    if (!m_db.commit()) {
        qWarning() << "[DatabaseManager] Failed to commit transaction for saveRanks";
        m_db.rollback();
        return false;
    }
    return true;
}

EngineState DatabaseManager::loadEngineState()
{
    EngineState state;
    if (!m_db.isOpen()) return state;

    QSqlQuery query(m_db);
    if (!query.exec("SELECT key, value FROM engine_state")) {
        logError("Load engine state", query);
        return state;
    }

    while (query.next()) {
        const QString key = query.value(0).toString();
        const QString value = query.value(1).toString();
        if (key == "library_seeded") {
            state.librarySeeded = (value == "1");
        } else if (key == "last_full_sync_at" && !value.isEmpty()) {
            state.lastFullSyncAt = QDateTime::fromMSecsSinceEpoch(value.toLongLong(), Qt::UTC);
        }
    }
    return state;
}

bool DatabaseManager::saveEngineState(const EngineState& state)
{
    if (!m_db.isOpen()) return false;

    QSqlQuery query(m_db);
    query.prepare("INSERT OR REPLACE INTO engine_state (key, value) VALUES (:key, :value)");

    query.bindValue(":key", "library_seeded");
    query.bindValue(":value", state.librarySeeded ? "1" : "0");
    if (!query.exec()) {
        logError("Save engine state (library_seeded)", query);
        return false;
    }

    query.bindValue(":key", "last_full_sync_at");
    query.bindValue(":value", state.lastFullSyncAt.isValid()
                                  ? QString::number(state.lastFullSyncAt.toMSecsSinceEpoch())
                                  : QString());
    if (!query.exec()) {
        logError("Save engine state (last_full_sync_at)", query);
        return false;
    }
    return true;
}

bool DatabaseManager::clearDatabase()
{
    if (!m_db.isOpen()) return false;

    QSqlQuery query(m_db);

    // Delete all data in correct order due to foreign keys
    const QStringList statements = {
        "DELETE FROM chart_ranks",
        "DELETE FROM play_facts",
        "DELETE FROM tracks",
        "DELETE FROM engine_state"
    };
    for (const QString& statement : statements) {
        if (!query.exec(statement)) {
            logError("Clear database", query);
            return false;
        }
    }

    // Reset autoincrement counters
    query.exec("DELETE FROM sqlite_sequence");

    return true;
}

bool DatabaseManager::beginTransaction()
{
    return m_db.transaction();
}

bool DatabaseManager::commitTransaction()
{
    return m_db.commit();
}

bool DatabaseManager::rollbackTransaction()
{
    return m_db.rollback();
}

QString DatabaseManager::defaultDatabasePath()
{
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataPath).filePath("encore.db");
}

void DatabaseManager::logError(const QString& operation, const QSqlQuery& query)
{
    QString error = QString("Database error in %1: %2").arg(operation, query.lastError().text());
    qCritical() << "[DatabaseManager]" << error;
    qCritical() << "[DatabaseManager] SQL:" << query.lastQuery();
    emit databaseError(error);
}

} // namespace Encore
