#include "completionevaluator.h"

namespace Encore {

bool CompletionEvaluator::isComplete(double listenedSeconds, double trackDurationSeconds)
{
    if (trackDurationSeconds <= 0) {
        return false;
    }
    return listenedSeconds / trackDurationSeconds >= COMPLETION_RATIO;
}

double CompletionEvaluator::completionRatio(double listenedSeconds, double trackDurationSeconds)
{
    if (trackDurationSeconds <= 0) {
        return 0.0;
    }
    return listenedSeconds / trackDurationSeconds;
}

} // namespace Encore
