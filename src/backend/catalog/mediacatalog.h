#ifndef MEDIACATALOG_H
#define MEDIACATALOG_H

#include <QList>
#include <QString>

#include "catalogentry.h"
#include "../sync/syncerror.h"

namespace Encore {

struct CatalogResult {
    QList<CatalogEntry> tracks;
    SyncError error = SyncError::None;
    QString errorMessage;

    bool ok() const { return error == SyncError::None; }
};

// Read access to the user's media library and the system play counters.
// Implementations must be callable from a worker thread; calls are never
// made concurrently.
class MediaCatalog
{
public:
    virtual ~MediaCatalog() = default;

    // All tracks in catalog order.
    virtual CatalogResult enumerateTracks() = 0;

    // Single track by persistent id. An empty result with no error means the
    // track is no longer in the catalog.
    virtual CatalogResult lookupTrack(const QString& persistentId) = 0;

    // The now-playing item, or an empty result when nothing is loaded.
    virtual CatalogResult currentlyPlayingTrack() = 0;
};

} // namespace Encore

#endif // MEDIACATALOG_H
