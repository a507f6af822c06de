#ifndef MPRISCATALOG_H
#define MPRISCATALOG_H

#include <QDBusConnection>
#include <QDBusError>
#include <QString>
#include <QVariant>
#include <QVariantList>

#include "../catalog/mediacatalog.h"

class QDBusMessage;

namespace Encore {

// Reads tracks and play counters from an MPRIS player.
// The TrackList interface is used when the player exposes one; otherwise
// the catalog is just the current track.
class MprisCatalog : public MediaCatalog
{
public:
    explicit MprisCatalog(const QString& serviceName,
                          const QDBusConnection& connection = QDBusConnection::sessionBus());

    CatalogResult enumerateTracks() override;
    CatalogResult lookupTrack(const QString& persistentId) override;
    CatalogResult currentlyPlayingTrack() override;

    QString serviceName() const { return m_serviceName; }

    static SyncError errorFromDBus(const QDBusError& error);

    static constexpr int METADATA_CHUNK_SIZE = 100;
    static constexpr int CALL_TIMEOUT_MS = 10000;

private:
    bool call(const QString& interfaceName, const QString& method,
              const QVariantList& arguments, QDBusMessage* reply, CatalogResult* result);
    bool readProperty(const QString& interfaceName, const QString& property,
                      QVariant* value, CatalogResult* result);
    void fail(CatalogResult* result, const QDBusError& error, const QString& what) const;

    QDBusConnection m_connection;
    QString m_serviceName;
};

} // namespace Encore

#endif // MPRISCATALOG_H
