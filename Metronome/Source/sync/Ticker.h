/**
 * The local fallback clock.
 *
 * When the audio clock isn't connected the metronome still needs to show
 * beats.  The Ticker substitutes for it, silently, by scheduling a deferred
 * callback on the ControlSequence for each beat and rescheduling itself
 * after every one.
 *
 * It has no configuration of its own.  On every firing it asks its Client
 * whether it is still allowed to run and what the tempo and beat count are
 * right now, so changes made while it is running are picked up on the next
 * beat without anyone having to tell it.
 *
 * The interval is measured from when the callback runs, not from when it was
 * supposed to run.  Dispatch latency accumulates as drift.  For a visual
 * metronome that is acceptable, and the moment the audio clock comes back it
 * takes over anyway.
 */

#pragma once

class Ticker
{
  public:

    /**
     * The thing that owns us, in practice TickMaster.
     */
    class Client {
      public:
        virtual ~Client() {}

        // true if playing and the audio clock is not connected
        virtual bool isTickerEligible() = 0;

        // current tempo in bpm, zero or less means use the default
        virtual int getTickerTempo() = 0;

        // current beats per measure, zero or less means use the default
        virtual int getTickerBeats() = 0;

        virtual void tickerBeat(int beat) = 0;
    };
    
    Ticker(Client* c, class ControlSequence* cs);
    ~Ticker();

    /**
     * Begin ticking from beat one.  The first beat is emitted on the
     * next pass of the control thread.  Starting an active ticker
     * restarts it.
     */
    void start();

    /**
     * Cancel the pending beat.  Safe to call when idle.
     */
    void stop();

    bool isActive() {
        return active;
    }

    /**
     * The beat that will be emitted next, zero when idle.
     */
    int getBeat() {
        return active ? beat : 0;
    }

    /**
     * The interval that was used for the last reschedule.
     */
    int getLastInterval() {
        return lastInterval;
    }
    
    // exposed for tests
    static int advanceBeat(int beat, int beats);
    static int beatInterval(int bpm);

  private:

    Client* client = nullptr;
    class ControlSequence* sequence = nullptr;

    bool active = false;
    int beat = 1;
    int pendingId = 0;
    int lastInterval = 0;
    
    void fire();
    void schedule(int delay);
    void cancelPending();
};
