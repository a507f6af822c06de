#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QString>
#include <QVariantMap>
#include <QHash>
#include <QList>
#include <QDateTime>

#include "../library/trackrecord.h"
#include "../library/playfact.h"
#include "../sync/enginestate.h"

namespace Encore {

class DatabaseManager : public QObject
{
    Q_OBJECT
public:
    explicit DatabaseManager(QObject *parent = nullptr);
    explicit DatabaseManager(const QString& connectionName, QObject *parent = nullptr);
    ~DatabaseManager();

    // Database initialization
    bool initializeDatabase(const QString& dbPath = QString());
    bool isOpen() const;
    void close();
    QString databasePath() const { return m_databasePath; }
    QString connectionName() const { return m_connectionName; }

    // Track operations
    int insertTrack(const TrackRecord& track); // returns the new row id, or 0 on failure
    bool updateTrack(int trackId, const QVariantMap& trackData);
    bool deleteTrack(int trackId); // cascades to play facts and ranks
    TrackRecord getTrack(int trackId);
    TrackRecord getTrackByPersistentId(const QString& persistentId);
    QList<TrackRecord> getAllTracks(); // catalog order
    int getTotalTracks();

    // Play fact operations
    qint64 insertPlayFact(const PlayFact& fact);
    bool insertPlayFacts(const QList<PlayFact>& facts);
    QList<PlayFact> getPlayFacts(int trackId, const QDateTime& from = QDateTime(),
                                 const QDateTime& to = QDateTime());
    int countPlayFacts(int trackId, const QDateTime& since = QDateTime());
    int countPlayFactsBySource(int trackId, PlaySource source, const QDateTime& since = QDateTime());
    QHash<int, int> getPlayFactCountsByTrack(const QDateTime& since = QDateTime());
    int getTotalPlayFacts();

    // Chart rank bookkeeping, keyed by view name
    QHash<int, int> getRanks(const QString& view);
    bool saveRanks(const QString& view, const QHash<int, int>& ranks);

    // Engine state
    EngineState loadEngineState();
    bool saveEngineState(const EngineState& state);

    // Library management
    bool clearDatabase();

    // Batch operations
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Default on-disk location
    static QString defaultDatabasePath();

signals:
    void databaseError(const QString& error);

private:
    bool createTables();
    bool applyMigrations(int currentVersion);
    bool createIndexes();
    void applyPragmas();
    bool bindAndExecPlayFact(QSqlQuery& query, const PlayFact& fact);
    QVariantMap trackRowToMap(const QSqlQuery& query) const;
    PlayFact playFactFromRow(const QSqlQuery& query) const;
    void logError(const QString& operation, const QSqlQuery& query);

    QSqlDatabase m_db;
    QString m_connectionName;
    QString m_databasePath;
    static const QString DB_CONNECTION_NAME;
};

} // namespace Encore

#endif // DATABASEMANAGER_H
