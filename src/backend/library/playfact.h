#ifndef PLAYFACT_H
#define PLAYFACT_H

#include <QString>
#include <QDateTime>
#include <QMetaType>
#include <optional>

namespace Encore {

enum class PlaySource {
    Live,        // observed while playing
    CounterSync  // recovered from a system play counter delta
};

inline QString playSourceToString(PlaySource source)
{
    return source == PlaySource::Live ? QStringLiteral("live") : QStringLiteral("counter_sync");
}

inline bool playSourceFromString(const QString& value, PlaySource* source)
{
    if (value == QLatin1String("live")) {
        *source = PlaySource::Live;
        return true;
    }
    if (value == QLatin1String("counter_sync")) {
        *source = PlaySource::CounterSync;
        return true;
    }
    return false;
}

// One asserted play. Immutable once stored.
struct PlayFact {
    qint64 id = 0;
    int trackId = 0;
    QDateTime timestamp;
    PlaySource source = PlaySource::Live;
    std::optional<double> listenedDuration;
    std::optional<double> trackDurationAtPlay;
    std::optional<double> completionRatio;

    bool isValid() const {
        return trackId > 0 && timestamp.isValid();
    }
};

} // namespace Encore

Q_DECLARE_METATYPE(Encore::PlayFact)

#endif // PLAYFACT_H
