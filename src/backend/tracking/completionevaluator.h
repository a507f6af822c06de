#ifndef COMPLETIONEVALUATOR_H
#define COMPLETIONEVALUATOR_H

namespace Encore {

// Decides whether a listen counts as a play. Stateless.
class CompletionEvaluator
{
public:
    // Fraction of the track that must be heard
    static constexpr double COMPLETION_RATIO = 0.5;

    // False when the duration is unknown (<= 0)
    static bool isComplete(double listenedSeconds, double trackDurationSeconds);

    // listened / duration, 0 when the duration is unknown
    static double completionRatio(double listenedSeconds, double trackDurationSeconds);
};

} // namespace Encore

#endif // COMPLETIONEVALUATOR_H
