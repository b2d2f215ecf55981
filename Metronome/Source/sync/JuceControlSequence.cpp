
#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "../util/Trace.h"

#include "JuceControlSequence.h"

JuceControlSequence::JuceControlSequence()
{
}

JuceControlSequence::~JuceControlSequence()
{
    stopAllTimers();
    pending.clear();
}

/**
 * Posted callbacks may still be in the message queue when we're deleted.
 * The weak reference keeps them from running after that, which matches
 * what cancel() promises for scheduled callbacks.
 */
void JuceControlSequence::post(Callback callback)
{
    juce::WeakReference<JuceControlSequence> self (this);
    
    bool queued = juce::MessageManager::callAsync([self, callback]() {
        if (self != nullptr)
          callback();
    });

    if (!queued)
      Trace(1, "JuceControlSequence: Unable to post message, no message thread");
}

int JuceControlSequence::schedule(int delayMillis, Callback callback)
{
    if (!isControlThread())
      Trace(1, "JuceControlSequence: schedule called outside the message thread");
    
    int id = allocateId();
    pending[id] = callback;

    // JUCE rounds anything under one up to one anyway
    if (delayMillis < 1)
      delayMillis = 1;
    
    startTimer(id, delayMillis);
    return id;
}

/**
 * Unknown ids are ignored so an id is never released twice.
 */
void JuceControlSequence::cancel(int id)
{
    auto it = pending.find(id);
    if (it != pending.end()) {
        stopTimer(id);
        pending.erase(it);
        releaseId(id);
    }
}

int JuceControlSequence::allocateId()
{
    int id = 0;
    if (freeIds.size() > 0) {
        id = freeIds.getFirst();
        freeIds.remove(0);
    }
    else {
        lastId++;
        id = lastId;
    }
    return id;
}

void JuceControlSequence::releaseId(int id)
{
    freeIds.add(id);
}

bool JuceControlSequence::isControlThread()
{
    return juce::MessageManager::existsAndIsCurrentThread();
}

void JuceControlSequence::timerCallback(int timerID)
{
    // one-shot
    stopTimer(timerID);

    auto it = pending.find(timerID);
    if (it == pending.end()) {
        // cancelled while the timer was firing, shouldn't happen on
        // the message thread but be safe
        Trace(2, "JuceControlSequence: Timer %ld has no callback", (long)timerID);
    }
    else {
        // remove before calling, the callback is likely to schedule
        // another one
        Callback callback = it->second;
        pending.erase(it);
        releaseId(timerID);
        callback();
    }
}
