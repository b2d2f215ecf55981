
#include "../util/Trace.h"
#include "../model/Tempo.h"
#include "../model/BeatLayout.h"

#include "ControlSequence.h"
#include "Ticker.h"

Ticker::Ticker(Client* c, ControlSequence* cs)
{
    client = c;
    sequence = cs;
}

Ticker::~Ticker()
{
    cancelPending();
}

void Ticker::start()
{
    // stop-before-start, there can only ever be one pending beat
    cancelPending();
    
    beat = 1;
    active = true;
    lastInterval = 0;
    
    Trace(2, "Ticker: Start");
    schedule(0);
}

void Ticker::stop()
{
    if (active)
      Trace(2, "Ticker: Stop");
    
    cancelPending();
    active = false;
}

void Ticker::cancelPending()
{
    if (pendingId > 0) {
        sequence->cancel(pendingId);
        pendingId = 0;
    }
}

void Ticker::schedule(int delay)
{
    pendingId = sequence->schedule(delay, [this]() {
        fire();
    });
}

/**
 * The ControlSequence callback.
 *
 * The eligibility check is the handoff boundary.  If we were stopped or the
 * audio clock connected since the last beat was scheduled, cancel should have
 * prevented this, but if it didn't the beat is not emitted and nothing is
 * rescheduled.
 */
void Ticker::fire()
{
    pendingId = 0;

    if (!active) {
        Trace(2, "Ticker: Ignoring beat after stop");
    }
    else if (!client->isTickerEligible()) {
        Trace(2, "Ticker: No longer eligible, stopping");
        active = false;
    }
    else {
        int emitted = beat;
        beat = advanceBeat(beat, client->getTickerBeats());
        
        client->tickerBeat(emitted);

        // the beat may have caused a stop, only reschedule if we're still going
        if (active && pendingId == 0) {
            lastInterval = beatInterval(client->getTickerTempo());
            schedule(lastInterval);
        }
    }
}

/**
 * Move to the next beat in the measure, wrapping back to one.
 * The beat count is clamped here since the layout could in theory
 * be anything, a missing count uses the default.
 */
int Ticker::advanceBeat(int current, int beats)
{
    if (beats <= 0)
      beats = BeatLayout::DefaultBeats;
    beats = BeatLayout::clampBeats(beats);
    
    return (current >= beats) ? 1 : current + 1;
}

int Ticker::beatInterval(int bpm)
{
    if (bpm <= 0)
      bpm = Tempo::Default;
    return Tempo::MillisPerMinute / bpm;
}
