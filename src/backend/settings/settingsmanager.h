#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>

namespace Encore {

class SettingsManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString playerService READ playerService WRITE setPlayerService NOTIFY playerServiceChanged)
    Q_PROPERTY(QString databasePath READ databasePath WRITE setDatabasePath NOTIFY databasePathChanged)
    Q_PROPERTY(int fullSyncIntervalHours READ fullSyncIntervalHours WRITE setFullSyncIntervalHours NOTIFY fullSyncIntervalHoursChanged)
    Q_PROPERTY(int reconcileBatchSize READ reconcileBatchSize WRITE setReconcileBatchSize NOTIFY reconcileBatchSizeChanged)
    Q_PROPERTY(bool trackingEnabled READ trackingEnabled WRITE setTrackingEnabled NOTIFY trackingEnabledChanged)
    Q_PROPERTY(bool notifyRankChanges READ notifyRankChanges WRITE setNotifyRankChanges NOTIFY notifyRankChangesChanged)

public:
    static SettingsManager* instance();
    ~SettingsManager();

    // Getters
    QString playerService() const { return m_playerService; }
    QString databasePath() const { return m_databasePath; }
    int fullSyncIntervalHours() const { return m_fullSyncIntervalHours; }
    int reconcileBatchSize() const { return m_reconcileBatchSize; }
    bool trackingEnabled() const { return m_trackingEnabled; }
    bool notifyRankChanges() const { return m_notifyRankChanges; }

    // Setters
    void setPlayerService(const QString& service);
    void setDatabasePath(const QString& path);
    void setFullSyncIntervalHours(int hours);
    void setReconcileBatchSize(int batchSize);
    void setTrackingEnabled(bool enabled);
    void setNotifyRankChanges(bool notify);

    static const char* const DEFAULT_PLAYER_SERVICE;

signals:
    void playerServiceChanged(const QString& service);
    void databasePathChanged(const QString& path);
    void fullSyncIntervalHoursChanged(int hours);
    void reconcileBatchSizeChanged(int batchSize);
    void trackingEnabledChanged(bool enabled);
    void notifyRankChangesChanged(bool notify);

private:
    explicit SettingsManager(QObject *parent = nullptr);
    void loadSettings();
    void saveSettings();

    static SettingsManager* s_instance;
    QSettings m_settings;

    QString m_playerService;
    QString m_databasePath;  // empty means the default location
    int m_fullSyncIntervalHours;
    int m_reconcileBatchSize;
    bool m_trackingEnabled;
    bool m_notifyRankChanges;
};

} // namespace Encore

#endif // SETTINGSMANAGER_H
