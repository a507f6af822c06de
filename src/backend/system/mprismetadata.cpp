#include "mprismetadata.h"

#include <QDBusArgument>
#include <QDBusObjectPath>
#include <QDBusVariant>
#include <QDebug>

namespace Encore {
namespace Mpris {

const char* const OBJECT_PATH = "/org/mpris/MediaPlayer2";
const char* const ROOT_INTERFACE = "org.mpris.MediaPlayer2";
const char* const PLAYER_INTERFACE = "org.mpris.MediaPlayer2.Player";
const char* const TRACKLIST_INTERFACE = "org.mpris.MediaPlayer2.TrackList";
const char* const PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";
const char* const NO_TRACK_PATH = "/org/mpris/MediaPlayer2/TrackList/NoTrack";

QVariant unwrap(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusVariant>()) {
        return unwrap(value.value<QDBusVariant>().variant());
    }
    return value;
}

QVariantMap toVariantMap(const QVariant& value)
{
    const QVariant plain = unwrap(value);
    if (plain.userType() == qMetaTypeId<QDBusArgument>()) {
        return qdbus_cast<QVariantMap>(plain.value<QDBusArgument>());
    }
    return plain.toMap();
}

QStringList toStringList(const QVariant& value)
{
    const QVariant plain = unwrap(value);
    if (plain.userType() == qMetaTypeId<QDBusArgument>()) {
        return qdbus_cast<QStringList>(plain.value<QDBusArgument>());
    }
    if (plain.userType() == QMetaType::QString) {
        const QString single = plain.toString();
        return single.isEmpty() ? QStringList() : QStringList{single};
    }
    return plain.toStringList();
}

QString trackIdFromMetadata(const QVariantMap& metadata)
{
    const QVariant raw = unwrap(metadata.value("mpris:trackid"));
    QString trackId;
    if (raw.userType() == qMetaTypeId<QDBusObjectPath>()) {
        trackId = raw.value<QDBusObjectPath>().path();
    } else {
        trackId = raw.toString();
    }

    if (trackId == QLatin1String(NO_TRACK_PATH)) {
        return QString();
    }
    return trackId;
}

CatalogEntry entryFromMetadata(const QVariantMap& metadata)
{
    CatalogEntry entry;

    const QString url = unwrap(metadata.value("xesam:url")).toString();
    entry.persistentId = url.isEmpty() ? trackIdFromMetadata(metadata) : url;
    if (entry.persistentId.isEmpty()) {
        return CatalogEntry();
    }

    entry.title = unwrap(metadata.value("xesam:title")).toString();
    entry.artist = toStringList(metadata.value("xesam:artist")).join(", ");
    entry.album = unwrap(metadata.value("xesam:album")).toString();

    // mpris:length is in microseconds; anything else means unknown
    bool ok = false;
    const qlonglong lengthUs = unwrap(metadata.value("mpris:length")).toLongLong(&ok);
    entry.durationSeconds = (ok && lengthUs > 0) ? lengthUs / 1000000.0 : 0.0;

    const QVariant useCount = unwrap(metadata.value("xesam:useCount"));
    if (useCount.isValid()) {
        const int count = useCount.toInt(&ok);
        if (ok && count >= 0) {
            entry.playCount = count;
            entry.playCountKnown = true;
        } else {
            qWarning() << "[Mpris] Ignoring malformed xesam:useCount for" << entry.persistentId;
        }
    }

    return entry;
}

PlaybackSampler::PlaybackStatus statusFromString(const QString& status)
{
    if (status == QLatin1String("Playing")) {
        return PlaybackSampler::Playing;
    }
    if (status == QLatin1String("Paused")) {
        return PlaybackSampler::Paused;
    }
    return PlaybackSampler::Stopped;
}

} // namespace Mpris
} // namespace Encore
