/**
 * Guesses a tempo from a series of taps.
 *
 * Each tap carries a timestamp in milliseconds from any monotonic epoch,
 * normally juce::Time::getMillisecondCounter.  Taps older than the window
 * are forgotten before the new one is added, so a pause longer than the
 * window starts a fresh estimate.  There is no explicit reset, old taps
 * just age out.
 *
 * The estimate is the average distance between consecutive taps still in
 * the window, converted to whole bpm and clamped.  With fewer than two taps
 * there is nothing to average and tap() returns zero, meaning leave the
 * tempo alone.  That is not an error, the first tap of a series always
 * does this.
 *
 * Averaging all the taps in the window rather than using the last delta
 * smooths out the wobble of a human finger.
 */

#pragma once

#include <juce_core/juce_core.h>

class TapTempoMonitor
{
  public:

    static constexpr int DefaultWindow = 5000;

    TapTempoMonitor() {}
    ~TapTempoMonitor() {}

    void setWindow(int millis);
    int getWindow() {
        return window;
    }

    // upper bound for the estimate, normally the configured tempo ceiling
    void setCeiling(int bpm);

    /**
     * Register a tap and return the new tempo estimate or zero
     * if there isn't one.
     */
    int tap(juce::int64 now);

    /**
     * Average distance in milliseconds between taps in the window,
     * truncated to an integer.  Zero if there are fewer than two taps.
     */
    int getAverageInterval();

    int getTapCount() {
        return taps.size();
    }

    // only for detach, normally taps decay on their own
    void reset();

  private:

    int window = DefaultWindow;
    int ceiling = 0;
    
    // most recent last
    juce::Array<juce::int64> taps;
    
    void prune(juce::int64 now);
};
