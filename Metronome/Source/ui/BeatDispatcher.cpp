
#include "../util/Trace.h"

#include "BeatIndicator.h"
#include "BeatDispatcher.h"

BeatDispatcher::BeatDispatcher()
{
    clear();
}

void BeatDispatcher::clear()
{
    indicators.fill(nullptr);
}

void BeatDispatcher::setIndicator(int beat, BeatIndicator* indicator)
{
    if (beat < 1 || beat > MaxIndicators)
      Trace(1, "BeatDispatcher: Invalid indicator number %ld", (long)beat);
    else
      indicators[beat - 1] = indicator;
}

BeatIndicator* BeatDispatcher::getIndicator(int beat)
{
    BeatIndicator* indicator = nullptr;
    if (beat >= 1 && beat <= MaxIndicators)
      indicator = indicators[beat - 1];
    return indicator;
}

bool BeatDispatcher::dispatch(int beat)
{
    bool dispatched = false;
    BeatIndicator* indicator = getIndicator(beat);
    if (indicator != nullptr) {
        indicator->blink();
        dispatched = true;
    }
    else if (beat < 1 || beat > MaxIndicators) {
        Trace(2, "BeatDispatcher: Dropping beat out of range %ld", (long)beat);
    }
    return dispatched;
}
