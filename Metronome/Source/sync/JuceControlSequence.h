/**
 * ControlSequence implemented on the JUCE message thread.
 *
 * Posted callbacks go through MessageManager::callAsync.  Scheduled callbacks
 * each get their own timer id in a juce::MultiTimer and are one-shot, the
 * timer is stopped before the callback runs.
 *
 * Stopping a MultiTimer from the message thread guarantees the callback will
 * not be delivered afterward which is the synchronous cancel that
 * ControlSequence requires.
 *
 * MultiTimer keeps a timer object for every id it has ever seen, so ids
 * are recycled.  An id is released when its callback fires or is cancelled
 * and the lowest released id is handed out next.  The number of timers
 * stays at the most that were ever pending at once, which for the
 * fallback ticker is one.
 */

#pragma once

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <map>

#include "ControlSequence.h"

class JuceControlSequence : public ControlSequence,
                            public juce::MultiTimer
{
  public:

    JuceControlSequence();
    ~JuceControlSequence();

    // ControlSequence
    void post(Callback callback) override;
    int schedule(int delayMillis, Callback callback) override;
    void cancel(int id) override;
    bool isControlThread() override;

    // MultiTimer
    void timerCallback(int timerID) override;

    int getPendingCount() {
        return (int)pending.size();
    }

    // the highest id ever handed out, also the number of timers
    int getHighestId() {
        return lastId;
    }
    
  private:

    // callbacks waiting for their timer
    std::map<int,Callback> pending;

    // ids that have been used and are free again
    juce::SortedSet<int> freeIds;
    
    int lastId = 0;

    int allocateId();
    void releaseId(int id);

    JUCE_DECLARE_WEAK_REFERENCEABLE(JuceControlSequence)
    JUCE_DECLARE_NON_COPYABLE(JuceControlSequence)
};
