/**
 * The single thread that owns all tick state.
 *
 * Everything in TickMaster, Ticker and the models is touched only from the
 * control thread.  That is what lets the handoff between the clock service and
 * the fallback ticker get away without locks.  There are three ways work
 * arrives on it:
 *
 *    - direct calls from the UI, which is already on the control thread
 *    - post() from any other thread, used to marshal external ticks
 *    - schedule() from the fallback ticker for its next beat
 *
 * cancel() must be synchronous.  Once it returns the callback will
 * not run, this is what prevents a stale fallback beat from firing after
 * the clock service has taken over.
 *
 * The implementation for the application is JuceControlSequence which
 * uses the JUCE message thread.  Tests use one with a simulated clock.
 */

#pragma once

#include <functional>

class ControlSequence
{
  public:

    typedef std::function<void()> Callback;
    
    virtual ~ControlSequence() {}

    /**
     * Run a callback on the control thread as soon as possible.
     * May be called from any thread.
     */
    virtual void post(Callback callback) = 0;

    /**
     * Run a callback on the control thread after a delay.
     * Returns an id that may be passed to cancel(), ids are never zero.
     * Once the callback has run or been cancelled the id may be handed
     * out again so the caller must forget it at that point.
     * Must be called on the control thread.
     */
    virtual int schedule(int delayMillis, Callback callback) = 0;

    /**
     * Cancel a scheduled callback.  Unknown or already fired ids are ignored.
     * Must be called on the control thread.
     */
    virtual void cancel(int id) = 0;

    /**
     * True if the calling thread is the control thread.
     */
    virtual bool isControlThread() = 0;
    
};
