#ifndef TRACKRECORD_H
#define TRACKRECORD_H

#include <QString>
#include <QVariant>
#include <QDateTime>
#include <QMetaType>

namespace Encore {

// A tracked library entry as stored in the play ledger.
//
// baselineCounter holds the plays that happened before bookkeeping began and is
// frozen once set. lastSeenCounter is the last system counter value accounted
// for; it is null until the player has reported a counter for this track.
struct TrackRecord {
    int id = 0;                 // row id, doubles as catalog order
    QString persistentId;
    QString title;
    QString artist;
    QString album;
    double duration = 0.0;      // in seconds, 0 when unknown
    int baselineCounter = 0;
    int lastSeenCounter = 0;
    bool counterKnown = false;  // false while lastSeenCounter is null
    int pendingLivePlays = 0;   // live plays the system counter has not caught up with yet
    QDateTime lastReconciledAt;
    QDateTime createdAt;

    // Create from QVariantMap (database query result)
    static TrackRecord fromVariantMap(const QVariantMap& map) {
        TrackRecord track;
        track.id = map.value("id").toInt();
        track.persistentId = map.value("persistentId").toString();
        track.title = map.value("title").toString();
        track.artist = map.value("artist").toString();
        track.album = map.value("album").toString();
        track.duration = map.value("duration").toDouble();
        track.baselineCounter = map.value("baselineCounter").toInt();
        const QVariant lastSeen = map.value("lastSeenCounter");
        track.counterKnown = lastSeen.isValid() && !lastSeen.isNull();
        track.lastSeenCounter = track.counterKnown ? lastSeen.toInt() : 0;
        track.pendingLivePlays = map.value("pendingLivePlays").toInt();
        track.lastReconciledAt = map.value("lastReconciledAt").toDateTime();
        track.createdAt = map.value("createdAt").toDateTime();
        return track;
    }

    QVariantMap toVariantMap() const {
        QVariantMap map;
        map["id"] = id;
        map["persistentId"] = persistentId;
        map["title"] = title;
        map["artist"] = artist;
        map["album"] = album;
        map["duration"] = duration;
        map["baselineCounter"] = baselineCounter;
        map["lastSeenCounter"] = counterKnown ? QVariant(lastSeenCounter) : QVariant();
        map["pendingLivePlays"] = pendingLivePlays;
        map["lastReconciledAt"] = lastReconciledAt;
        map["createdAt"] = createdAt;
        return map;
    }

    bool isValid() const {
        return id > 0 && !persistentId.isEmpty();
    }
};

} // namespace Encore

Q_DECLARE_METATYPE(Encore::TrackRecord)

#endif // TRACKRECORD_H
