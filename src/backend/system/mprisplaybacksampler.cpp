#include "mprisplaybacksampler.h"

#include <QDBusArgument>
#include <QDBusMessage>
#include <QDBusServiceWatcher>
#include <QDBusConnectionInterface>
#include <QDebug>

#include "mprismetadata.h"

namespace Encore {

MprisPlaybackSampler::MprisPlaybackSampler(const QString& serviceName,
                                           const QDBusConnection& connection,
                                           QObject *parent)
    : PlaybackSampler(parent)
    , m_connection(connection)
    , m_serviceName(serviceName)
{
}

MprisPlaybackSampler::~MprisPlaybackSampler()
{
    stop();
}

bool MprisPlaybackSampler::start()
{
    if (m_started) {
        return true;
    }

    if (!m_connection.isConnected()) {
        qWarning() << "[MprisPlaybackSampler] Could not connect to D-Bus session bus";
        return false;
    }

    bool connected = m_connection.connect(
        m_serviceName,
        Mpris::OBJECT_PATH,
        Mpris::PROPERTIES_INTERFACE,
        "PropertiesChanged",
        this,
        SLOT(onPropertiesChanged(QString,QVariantMap,QStringList)));

    if (!connected) {
        qWarning() << "[MprisPlaybackSampler] Could not subscribe to PropertiesChanged of"
                   << m_serviceName << ":" << m_connection.lastError().message();
        return false;
    }

    m_watcher = new QDBusServiceWatcher(m_serviceName, m_connection,
                                        QDBusServiceWatcher::WatchForOwnerChange, this);
    connect(m_watcher, &QDBusServiceWatcher::serviceRegistered,
            this, &MprisPlaybackSampler::onServiceRegistered);
    connect(m_watcher, &QDBusServiceWatcher::serviceUnregistered,
            this, &MprisPlaybackSampler::onServiceUnregistered);

    m_started = true;
    qDebug() << "[MprisPlaybackSampler] Watching" << m_serviceName;

    // The player may not be running yet; the watcher picks it up later
    if (m_connection.interface() && m_connection.interface()->isServiceRegistered(m_serviceName).value()) {
        refresh();
    } else {
        qDebug() << "[MprisPlaybackSampler]" << m_serviceName << "is not running";
    }

    return true;
}

void MprisPlaybackSampler::stop()
{
    if (!m_started) {
        return;
    }

    m_connection.disconnect(
        m_serviceName,
        Mpris::OBJECT_PATH,
        Mpris::PROPERTIES_INTERFACE,
        "PropertiesChanged",
        this,
        SLOT(onPropertiesChanged(QString,QVariantMap,QStringList)));

    if (m_watcher) {
        delete m_watcher;
        m_watcher = nullptr;
    }

    m_started = false;
    qDebug() << "[MprisPlaybackSampler] Stopped watching" << m_serviceName;
}

void MprisPlaybackSampler::onPropertiesChanged(const QString& interfaceName,
                                               const QVariantMap& changedProperties,
                                               const QStringList& invalidatedProperties)
{
    if (interfaceName != QLatin1String(Mpris::PLAYER_INTERFACE)) {
        return;
    }

    // Some players only invalidate and expect a re-read
    if (invalidatedProperties.contains("Metadata") || invalidatedProperties.contains("PlaybackStatus")) {
        refresh();
        return;
    }

    applyPlayerProperties(changedProperties);
}

void MprisPlaybackSampler::onServiceRegistered(const QString& serviceName)
{
    qDebug() << "[MprisPlaybackSampler]" << serviceName << "appeared on the bus";
    refresh();
    reportPlayerAppeared();
}

void MprisPlaybackSampler::onServiceUnregistered(const QString& serviceName)
{
    qDebug() << "[MprisPlaybackSampler]" << serviceName << "left the bus";
    reportInterruption();
}

void MprisPlaybackSampler::refresh()
{
    QDBusMessage call = QDBusMessage::createMethodCall(
        m_serviceName, Mpris::OBJECT_PATH, Mpris::PROPERTIES_INTERFACE, "GetAll");
    call << QString(Mpris::PLAYER_INTERFACE);

    QDBusMessage reply = m_connection.call(call, QDBus::Block, CALL_TIMEOUT_MS);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        qWarning() << "[MprisPlaybackSampler] Failed to read player state:"
                   << reply.errorName() << reply.errorMessage();
        return;
    }

    if (reply.arguments().isEmpty()) {
        qWarning() << "[MprisPlaybackSampler] Empty GetAll reply from" << m_serviceName;
        return;
    }

    applyPlayerProperties(Mpris::toVariantMap(reply.arguments().first()));
}

void MprisPlaybackSampler::applyPlayerProperties(const QVariantMap& properties)
{
    const bool hasMetadata = properties.contains("Metadata");
    const bool hasStatus = properties.contains("PlaybackStatus");

    CatalogEntry entry = nowPlaying();
    if (hasMetadata) {
        entry = Mpris::entryFromMetadata(Mpris::toVariantMap(properties.value("Metadata")));
    }

    PlaybackStatus playbackStatus = status();
    if (hasStatus) {
        playbackStatus = Mpris::statusFromString(Mpris::unwrap(properties.value("PlaybackStatus")).toString());
    }

    if (hasMetadata && hasStatus) {
        updatePlayerState(entry, playbackStatus);
    } else if (hasMetadata) {
        updateNowPlaying(entry);
    } else if (hasStatus) {
        updatePlaybackStatus(playbackStatus);
    }
}

} // namespace Encore
