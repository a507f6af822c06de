#ifndef MPRISPLAYBACKSAMPLER_H
#define MPRISPLAYBACKSAMPLER_H

#include <QDBusConnection>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include "../playback/playbacksampler.h"

class QDBusServiceWatcher;

namespace Encore {

// Observes one MPRIS player on the session bus.
class MprisPlaybackSampler : public PlaybackSampler
{
    Q_OBJECT

public:
    explicit MprisPlaybackSampler(const QString& serviceName,
                                  const QDBusConnection& connection = QDBusConnection::sessionBus(),
                                  QObject *parent = nullptr);
    ~MprisPlaybackSampler();

    bool start() override;
    void stop() override;

    QString serviceName() const { return m_serviceName; }

private slots:
    void onPropertiesChanged(const QString& interfaceName,
                             const QVariantMap& changedProperties,
                             const QStringList& invalidatedProperties);
    void onServiceRegistered(const QString& serviceName);
    void onServiceUnregistered(const QString& serviceName);

private:
    // Re-reads the whole Player interface; failures are logged and the next change retries
    void refresh();
    void applyPlayerProperties(const QVariantMap& properties);

    QDBusConnection m_connection;
    QString m_serviceName;
    QDBusServiceWatcher* m_watcher = nullptr;
    bool m_started = false;

    static constexpr int CALL_TIMEOUT_MS = 3000;
};

} // namespace Encore

#endif // MPRISPLAYBACKSAMPLER_H
