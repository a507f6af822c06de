#include "settingsmanager.h"
#include <QDebug>

#include "../reconcile/counterreconciler.h"
#include "../sync/syncscheduler.h"

namespace Encore {

SettingsManager* SettingsManager::s_instance = nullptr;

const char* const SettingsManager::DEFAULT_PLAYER_SERVICE = "org.mpris.MediaPlayer2.vlc";

SettingsManager::SettingsManager(QObject *parent)
    : QObject(parent)
    , m_settings("encore", "encore")
    , m_playerService(DEFAULT_PLAYER_SERVICE)
    , m_fullSyncIntervalHours(SyncScheduler::DEFAULT_FULL_SYNC_INTERVAL_HOURS)
    , m_reconcileBatchSize(CounterReconciler::DEFAULT_BATCH_SIZE)
    , m_trackingEnabled(true)
    , m_notifyRankChanges(true)
{
    loadSettings();
}

SettingsManager::~SettingsManager()
{
    qDebug() << "[SettingsManager::~SettingsManager] Destructor called, saving settings...";
    saveSettings();
    s_instance = nullptr;
}

SettingsManager* SettingsManager::instance()
{
    if (!s_instance) {
        s_instance = new SettingsManager();
    }
    return s_instance;
}

void SettingsManager::setPlayerService(const QString& service)
{
    if (m_playerService != service && !service.isEmpty()) {
        m_playerService = service;
        emit playerServiceChanged(service);
        saveSettings();
    }
}

void SettingsManager::setDatabasePath(const QString& path)
{
    if (m_databasePath != path) {
        m_databasePath = path;
        emit databasePathChanged(path);
        saveSettings();
    }
}

void SettingsManager::setFullSyncIntervalHours(int hours)
{
    hours = qBound(1, hours, 24 * 7);
    if (m_fullSyncIntervalHours != hours) {
        m_fullSyncIntervalHours = hours;
        emit fullSyncIntervalHoursChanged(hours);
        saveSettings();
    }
}

void SettingsManager::setReconcileBatchSize(int batchSize)
{
    batchSize = qBound(1, batchSize, 10000);
    if (m_reconcileBatchSize != batchSize) {
        m_reconcileBatchSize = batchSize;
        emit reconcileBatchSizeChanged(batchSize);
        saveSettings();
    }
}

void SettingsManager::setTrackingEnabled(bool enabled)
{
    if (m_trackingEnabled != enabled) {
        m_trackingEnabled = enabled;
        emit trackingEnabledChanged(enabled);
        saveSettings();
    }
}

void SettingsManager::setNotifyRankChanges(bool notify)
{
    if (m_notifyRankChanges != notify) {
        m_notifyRankChanges = notify;
        emit notifyRankChangesChanged(notify);
        saveSettings();
    }
}

void SettingsManager::loadSettings()
{
    m_settings.beginGroup("Player");
    m_playerService = m_settings.value("service", DEFAULT_PLAYER_SERVICE).toString();
    if (m_playerService.isEmpty()) {
        m_playerService = DEFAULT_PLAYER_SERVICE;
    }
    m_trackingEnabled = m_settings.value("trackingEnabled", true).toBool();
    m_settings.endGroup();

    m_settings.beginGroup("Storage");
    m_databasePath = m_settings.value("databasePath", QString()).toString();
    m_settings.endGroup();

    m_settings.beginGroup("Sync");
    m_fullSyncIntervalHours = m_settings.value("fullSyncIntervalHours",
                                               SyncScheduler::DEFAULT_FULL_SYNC_INTERVAL_HOURS).toInt();
    // Ensure the interval is usable
    if (m_fullSyncIntervalHours < 1) {
        m_fullSyncIntervalHours = SyncScheduler::DEFAULT_FULL_SYNC_INTERVAL_HOURS;
    }
    m_reconcileBatchSize = m_settings.value("batchSize", CounterReconciler::DEFAULT_BATCH_SIZE).toInt();
    if (m_reconcileBatchSize < 1) {
        m_reconcileBatchSize = CounterReconciler::DEFAULT_BATCH_SIZE;
    }
    m_settings.endGroup();

    m_settings.beginGroup("Charts");
    m_notifyRankChanges = m_settings.value("notifyRankChanges", true).toBool();
    m_settings.endGroup();
}

void SettingsManager::saveSettings()
{
    m_settings.beginGroup("Player");
    m_settings.setValue("service", m_playerService);
    m_settings.setValue("trackingEnabled", m_trackingEnabled);
    m_settings.endGroup();

    m_settings.beginGroup("Storage");
    m_settings.setValue("databasePath", m_databasePath);
    m_settings.endGroup();

    m_settings.beginGroup("Sync");
    m_settings.setValue("fullSyncIntervalHours", m_fullSyncIntervalHours);
    m_settings.setValue("batchSize", m_reconcileBatchSize);
    m_settings.endGroup();

    m_settings.beginGroup("Charts");
    m_settings.setValue("notifyRankChanges", m_notifyRankChanges);
    m_settings.endGroup();

    m_settings.sync();
}

} // namespace Encore
