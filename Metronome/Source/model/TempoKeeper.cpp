
#include "../util/Trace.h"

#include "Tempo.h"
#include "TempoKeeper.h"

void TempoKeeper::setCeiling(int max)
{
    ceiling = Tempo::clamp(max);
    if (tempo.getValue() > ceiling)
      tempo = Tempo(ceiling, ceiling);
}

void TempoKeeper::setLargeStep(int n)
{
    largeStep = (n > 0) ? n : 1;
}

void TempoKeeper::reset(int bpm)
{
    tempo = Tempo(bpm, ceiling);
}

bool TempoKeeper::setTempo(int bpm)
{
    Tempo neu (bpm, ceiling);
    if (neu.getValue() != bpm)
      Trace(2, "TempoKeeper: Clamped tempo %ld to %ld", (long)bpm, (long)neu.getValue());
    
    bool changed = (neu != tempo);
    tempo = neu;
    return changed;
}

bool TempoKeeper::setTempo(const Tempo& t)
{
    return setTempo(t.getValue());
}

bool TempoKeeper::increment()
{
    bool changed = false;
    int value = tempo.getValue();
    if (value < ceiling) {
        tempo = Tempo(value + 1, ceiling);
        changed = true;
    }
    return changed;
}

bool TempoKeeper::decrement()
{
    bool changed = false;
    int value = tempo.getValue();
    if (value > Tempo::Min) {
        tempo = Tempo(value - 1, ceiling);
        changed = true;
    }
    return changed;
}

/**
 * The large steps are repeated unit steps rather than one multiplied step
 * so they stop at the bound exactly the way a series of single clicks would.
 */
bool TempoKeeper::incrementLarge()
{
    bool changed = false;
    for (int i = 0 ; i < largeStep ; i++) {
        if (increment())
          changed = true;
    }
    return changed;
}

bool TempoKeeper::decrementLarge()
{
    bool changed = false;
    for (int i = 0 ; i < largeStep ; i++) {
        if (decrement())
          changed = true;
    }
    return changed;
}
