#ifndef CATALOGENTRY_H
#define CATALOGENTRY_H

#include <QString>
#include <QVariantMap>
#include <QMetaType>

namespace Encore {

// One track as reported by the media catalog or the now-playing stream.
struct CatalogEntry {
    QString persistentId;      // stable library identifier
    QString title;
    QString artist;
    QString album;
    double durationSeconds = 0.0;  // 0 when unknown
    int playCount = 0;             // system play counter
    bool playCountKnown = false;   // false when the player does not report a counter

    QVariantMap toVariantMap() const {
        QVariantMap map;
        map["persistentId"] = persistentId;
        map["title"] = title;
        map["artist"] = artist;
        map["album"] = album;
        map["duration"] = durationSeconds;
        if (playCountKnown) {
            map["playCount"] = playCount;
        }
        return map;
    }

    bool isValid() const {
        return !persistentId.isEmpty();
    }

    bool operator==(const CatalogEntry& other) const {
        return persistentId == other.persistentId;
    }
    bool operator!=(const CatalogEntry& other) const {
        return !(*this == other);
    }
};

} // namespace Encore

Q_DECLARE_METATYPE(Encore::CatalogEntry)

#endif // CATALOGENTRY_H
