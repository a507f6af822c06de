#ifndef ENGINESTATE_H
#define ENGINESTATE_H

#include <QDateTime>

namespace Encore {

// Persisted scheduler bookkeeping, loaded once at startup.
struct EngineState {
    bool librarySeeded = false;
    QDateTime lastFullSyncAt;  // invalid when no full sync has completed yet
};

} // namespace Encore

#endif // ENGINESTATE_H
