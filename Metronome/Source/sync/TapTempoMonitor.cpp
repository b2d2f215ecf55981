
#include <juce_core/juce_core.h>

#include "../util/Trace.h"
#include "../model/Tempo.h"

#include "TapTempoMonitor.h"

void TapTempoMonitor::setWindow(int millis)
{
    window = (millis > 0) ? millis : DefaultWindow;
}

void TapTempoMonitor::setCeiling(int bpm)
{
    ceiling = bpm;
}

void TapTempoMonitor::reset()
{
    taps.clear();
}

int TapTempoMonitor::tap(juce::int64 now)
{
    int bpm = 0;
    
    prune(now);
    taps.add(now);

    int interval = getAverageInterval();
    if (interval > 0) {
        int raw = Tempo::fromMillis(interval);
        bpm = (ceiling > 0) ? Tempo::clamp(raw, ceiling) : Tempo::clamp(raw);
        Trace(3, "TapTempoMonitor: %ld taps average %ld msec tempo %ld",
              (long)taps.size(), (long)interval, (long)bpm);
    }
    else if (taps.size() > 1) {
        // taps closer together than a millisecond, or time went backward
        Trace(2, "TapTempoMonitor: Ignoring unusable tap interval %ld", (long)interval);
    }
    
    return bpm;
}

/**
 * Drop anything older than the window.
 * A tap exactly at the edge of the window is kept.
 * Taps later than now are dropped too.  That happens when the millisecond
 * counter wraps, and left alone they would make every interval negative
 * until they aged out, which they never would.
 */
void TapTempoMonitor::prune(juce::int64 now)
{
    for (int i = taps.size() - 1 ; i >= 0 ; i--) {
        juce::int64 age = now - taps[i];
        if (age > window || age < 0)
          taps.remove(i);
    }
}

int TapTempoMonitor::getAverageInterval()
{
    int interval = 0;
    int count = taps.size();
    if (count > 1) {
        double total = 0.0;
        for (int i = 1 ; i < count ; i++)
          total += (double)(taps[i] - taps[i-1]);
        
        // truncate like the old integer conversion did
        interval = (int)(total / (double)(count - 1));
    }
    return interval;
}
