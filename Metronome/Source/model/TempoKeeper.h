/**
 * Holder for the current Tempo and the operations the UI uses to change it.
 *
 * None of these fail.  Values out of range are clamped, steps that would
 * cross a bound are refused.  Each operation returns true if the tempo
 * actually changed so the owner knows whether there is anything to forward.
 */

#pragma once

#include "Tempo.h"

class TempoKeeper
{
  public:

    TempoKeeper() {}
    ~TempoKeeper() {}

    /**
     * Lower the ceiling from the configuration.
     * The current tempo is brought within the new range.
     */
    void setCeiling(int max);
    int getCeiling() const {
        return ceiling;
    }

    void setLargeStep(int n);
    int getLargeStep() const {
        return largeStep;
    }

    // replace the tempo without any change detection, used on reset
    void reset(int bpm);

    const Tempo& getTempo() const {
        return tempo;
    }

    bool setTempo(int bpm);
    bool setTempo(const Tempo& t);
    
    bool increment();
    bool decrement();
    bool incrementLarge();
    bool decrementLarge();

  private:

    Tempo tempo;
    int ceiling = Tempo::Max;
    int largeStep = 10;
    
};
