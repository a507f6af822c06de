#include "mpriscatalog.h"

#include <QDBusArgument>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QDBusVariant>
#include <QDebug>
#include <QList>
#include <QSet>

#include "mprismetadata.h"

namespace Encore {

MprisCatalog::MprisCatalog(const QString& serviceName, const QDBusConnection& connection)
    : m_connection(connection)
    , m_serviceName(serviceName)
{
}

SyncError MprisCatalog::errorFromDBus(const QDBusError& error)
{
    switch (error.type()) {
    case QDBusError::NoError:
        return SyncError::None;
    case QDBusError::AccessDenied:
    case QDBusError::AuthFailed:
        return SyncError::PermissionDenied;
    default:
        return SyncError::CatalogUnavailable;
    }
}

void MprisCatalog::fail(CatalogResult* result, const QDBusError& error, const QString& what) const
{
    result->tracks.clear();
    result->error = errorFromDBus(error);
    if (result->error == SyncError::None) {
        result->error = SyncError::CatalogUnavailable;
    }
    result->errorMessage = QString("%1: %2 (%3)").arg(what, error.message(), error.name());
    qWarning() << "[MprisCatalog]" << result->errorMessage;
}

bool MprisCatalog::call(const QString& interfaceName, const QString& method,
                        const QVariantList& arguments, QDBusMessage* reply, CatalogResult* result)
{
    if (!m_connection.isConnected()) {
        result->error = SyncError::CatalogUnavailable;
        result->errorMessage = "D-Bus session bus is not connected";
        qWarning() << "[MprisCatalog]" << result->errorMessage;
        return false;
    }

    QDBusMessage message = QDBusMessage::createMethodCall(
        m_serviceName, Mpris::OBJECT_PATH, interfaceName, method);
    message.setArguments(arguments);

    *reply = m_connection.call(message, QDBus::Block, CALL_TIMEOUT_MS);
    if (reply->type() != QDBusMessage::ReplyMessage) {
        fail(result, QDBusError(*reply), QString("%1.%2 failed").arg(interfaceName, method));
        return false;
    }
    return true;
}

bool MprisCatalog::readProperty(const QString& interfaceName, const QString& property,
                                QVariant* value, CatalogResult* result)
{
    QDBusMessage reply;
    if (!call(Mpris::PROPERTIES_INTERFACE, "Get", {interfaceName, property}, &reply, result)) {
        return false;
    }

    if (reply.arguments().isEmpty()) {
        result->error = SyncError::CatalogUnavailable;
        result->errorMessage = QString("Empty reply reading %1.%2").arg(interfaceName, property);
        qWarning() << "[MprisCatalog]" << result->errorMessage;
        return false;
    }

    *value = Mpris::unwrap(reply.arguments().first());
    return true;
}

CatalogResult MprisCatalog::currentlyPlayingTrack()
{
    CatalogResult result;

    QVariant metadata;
    if (!readProperty(Mpris::PLAYER_INTERFACE, "Metadata", &metadata, &result)) {
        return result;
    }

    CatalogEntry entry = Mpris::entryFromMetadata(Mpris::toVariantMap(metadata));
    if (entry.isValid()) {
        result.tracks.append(entry);
    }
    return result;
}

CatalogResult MprisCatalog::enumerateTracks()
{
    CatalogResult result;

    QVariant hasTrackList;
    if (!readProperty(Mpris::ROOT_INTERFACE, "HasTrackList", &hasTrackList, &result)) {
        return result;
    }

    if (!hasTrackList.toBool()) {
        qDebug() << "[MprisCatalog]" << m_serviceName << "has no track list, using the current track only";
        return currentlyPlayingTrack();
    }

    QVariant tracksValue;
    if (!readProperty(Mpris::TRACKLIST_INTERFACE, "Tracks", &tracksValue, &result)) {
        return result;
    }

    QList<QDBusObjectPath> trackIds;
    if (tracksValue.userType() == qMetaTypeId<QDBusArgument>()) {
        trackIds = qdbus_cast<QList<QDBusObjectPath>>(tracksValue.value<QDBusArgument>());
    } else {
        trackIds = tracksValue.value<QList<QDBusObjectPath>>();
    }

    qDebug() << "[MprisCatalog] Track list of" << m_serviceName << "has" << trackIds.size() << "entries";

    QSet<QString> seen;

    for (int start = 0; start < trackIds.size(); start += METADATA_CHUNK_SIZE) {
        const QList<QDBusObjectPath> chunk = trackIds.mid(start, METADATA_CHUNK_SIZE);

        QDBusMessage reply;
        if (!call(Mpris::TRACKLIST_INTERFACE, "GetTracksMetadata",
                  {QVariant::fromValue(chunk)}, &reply, &result)) {
            return result;
        }

        if (reply.arguments().isEmpty()) {
            result.tracks.clear();
            result.error = SyncError::CatalogUnavailable;
            result.errorMessage = "Empty GetTracksMetadata reply";
            qWarning() << "[MprisCatalog]" << result.errorMessage;
            return result;
        }

        const QVariant raw = reply.arguments().first();
        QList<QVariantMap> metadataList;
        if (raw.userType() == qMetaTypeId<QDBusArgument>()) {
            metadataList = qdbus_cast<QList<QVariantMap>>(raw.value<QDBusArgument>());
        }

        for (const QVariantMap& metadata : metadataList) {
            CatalogEntry entry = Mpris::entryFromMetadata(metadata);
            if (!entry.isValid()) {
                continue;
            }
            // A queue can list the same file twice
            if (!seen.contains(entry.persistentId)) {
                seen.insert(entry.persistentId);
                result.tracks.append(entry);
            }
        }
    }

    return result;
}

CatalogResult MprisCatalog::lookupTrack(const QString& persistentId)
{
    CatalogResult current = currentlyPlayingTrack();
    if (!current.ok()) {
        return current;
    }

    if (!current.tracks.isEmpty() && current.tracks.first().persistentId == persistentId) {
        return current;
    }

    CatalogResult all = enumerateTracks();
    if (!all.ok()) {
        return all;
    }

    CatalogResult found;
    for (const CatalogEntry& entry : all.tracks) {
        if (entry.persistentId == persistentId) {
            found.tracks.append(entry);
            break;
        }
    }
    return found;
}

} // namespace Encore
