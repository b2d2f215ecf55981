/**
 * Routes beats to the indicator for that beat.
 *
 * There is one slot for each possible beat in a measure.  Beats outside
 * that range, or for slots nobody registered, are dropped.  That happens
 * briefly when the beat count shrinks while a tick for the old count
 * is already on its way.
 */

#pragma once

#include <array>

class BeatDispatcher
{
  public:

    static constexpr int MaxIndicators = 8;
    
    BeatDispatcher();
    ~BeatDispatcher() {}

    /**
     * Register the indicator for a 1 based beat number.
     * Passing nullptr clears the slot.
     */
    void setIndicator(int beat, class BeatIndicator* indicator);
    class BeatIndicator* getIndicator(int beat);

    void clear();

    /**
     * Blink the indicator for this beat.
     * Returns false if the beat was dropped.
     */
    bool dispatch(int beat);

  private:

    std::array<class BeatIndicator*, MaxIndicators> indicators;
    
};
