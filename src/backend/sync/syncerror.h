#ifndef SYNCERROR_H
#define SYNCERROR_H

#include <QString>

namespace Encore {

// Failure classes reported by catalog access and reconciliation.
// InvalidDuration is not an error: an unknown duration is stored as 0 and
// simply never completes a live play.
enum class SyncError {
    None,
    PermissionDenied,   // no access to the player or its catalog; not retried automatically
    CatalogUnavailable, // transient; the next scheduled sync retries
    PersistenceFailure  // a write did not commit; the next scheduled sync retries
};

inline QString syncErrorToString(SyncError error)
{
    switch (error) {
    case SyncError::None:
        return QStringLiteral("none");
    case SyncError::PermissionDenied:
        return QStringLiteral("permission denied");
    case SyncError::CatalogUnavailable:
        return QStringLiteral("catalog unavailable");
    case SyncError::PersistenceFailure:
        return QStringLiteral("persistence failure");
    }
    return QStringLiteral("unknown");
}

} // namespace Encore

#endif // SYNCERROR_H
