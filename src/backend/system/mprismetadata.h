#ifndef MPRISMETADATA_H
#define MPRISMETADATA_H

#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QStringList>

#include "../catalog/catalogentry.h"
#include "../playback/playbacksampler.h"

namespace Encore {
namespace Mpris {

extern const char* const OBJECT_PATH;
extern const char* const ROOT_INTERFACE;
extern const char* const PLAYER_INTERFACE;
extern const char* const TRACKLIST_INTERFACE;
extern const char* const PROPERTIES_INTERFACE;
extern const char* const NO_TRACK_PATH;

// Unwraps QDBusVariant and QDBusArgument values as delivered by QtDBus
QVariant unwrap(const QVariant& value);
QVariantMap toVariantMap(const QVariant& value);
QStringList toStringList(const QVariant& value);

// Builds an entry from an MPRIS metadata map (a{sv}).
// The persistent id is xesam:url when present, otherwise mpris:trackid.
CatalogEntry entryFromMetadata(const QVariantMap& metadata);

// mpris:trackid as a plain string, empty for the NoTrack path
QString trackIdFromMetadata(const QVariantMap& metadata);

PlaybackSampler::PlaybackStatus statusFromString(const QString& status);

} // namespace Mpris
} // namespace Encore

#endif // MPRISMETADATA_H
