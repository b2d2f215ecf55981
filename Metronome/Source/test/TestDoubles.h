/**
 * Test doubles for the metronome core.
 *
 * ManualControlSequence replaces the message thread with a simulated
 * millisecond clock.  Nothing runs until the test calls advance() or
 * runPosted(), so timing tests are exact and don't sleep.
 *
 * RecordingClockService and RecordingIndicator remember what was done
 * to them so tests can check the outbound calls.
 */

#pragma once

#include <juce_core/juce_core.h>

#include <map>
#include <vector>

#include "../sync/ControlSequence.h"
#include "../sync/ClockService.h"
#include "../ui/BeatIndicator.h"

class ManualControlSequence : public ControlSequence
{
  public:

    ManualControlSequence() {
        controlThread = juce::Thread::getCurrentThreadId();
    }

    void post(Callback callback) override {
        const juce::ScopedLock lock (postLock);
        posted.push_back(callback);
    }

    int schedule(int delayMillis, Callback callback) override {
        lastId++;
        Entry e;
        e.due = now + ((delayMillis > 0) ? delayMillis : 0);
        e.callback = callback;
        entries[lastId] = e;
        scheduleCount++;
        lastDelay = delayMillis;
        return lastId;
    }

    void cancel(int id) override {
        entries.erase(id);
    }

    bool isControlThread() override {
        return juce::Thread::getCurrentThreadId() == controlThread;
    }

    /**
     * Run everything that was posted, including things posted by
     * the callbacks themselves.
     */
    int runPosted() {
        int count = 0;
        while (true) {
            std::vector<Callback> batch;
            {
                const juce::ScopedLock lock (postLock);
                batch.swap(posted);
            }
            if (batch.size() == 0)
              break;
            for (auto& cb : batch) {
                cb();
                count++;
            }
        }
        return count;
    }

    /**
     * Move the clock forward, running scheduled callbacks in due order.
     * The clock is set to each callback's due time before it runs so
     * anything it schedules is relative to that.
     */
    void advance(int millis) {
        runPosted();
        juce::int64 target = now + millis;
        while (true) {
            auto next = entries.end();
            for (auto it = entries.begin() ; it != entries.end() ; ++it) {
                if (it->second.due <= target) {
                    if (next == entries.end() || it->second.due < next->second.due)
                      next = it;
                }
            }
            if (next == entries.end())
              break;
            
            now = next->second.due;
            Callback cb = next->second.callback;
            entries.erase(next);
            cb();
            runPosted();
        }
        now = target;
    }

    juce::int64 getNow() {
        return now;
    }

    int getPendingCount() {
        return (int)entries.size();
    }

    int getPostedCount() {
        const juce::ScopedLock lock (postLock);
        return (int)posted.size();
    }

    int scheduleCount = 0;
    int lastDelay = -1;
    
  private:

    class Entry {
      public:
        juce::int64 due = 0;
        Callback callback;
    };

    juce::Thread::ThreadID controlThread = nullptr;
    juce::int64 now = 0;
    int lastId = 0;
    std::map<int,Entry> entries;

    juce::CriticalSection postLock;
    std::vector<Callback> posted;
};

class RecordingClockService : public ClockService
{
  public:

    void setBeats(int beats) override {
        calls.add("beats " + juce::String(beats));
    }
    
    void setSubdivisions(int subdivisions) override {
        calls.add("subdivisions " + juce::String(subdivisions));
    }
    
    void setGaps(const juce::SortedSet<int>& gaps) override {
        juce::StringArray tokens;
        for (auto g : gaps)
          tokens.add(juce::String(g));
        calls.add("gaps " + tokens.joinIntoString(","));
    }
    
    void setTempo(int bpm) override {
        calls.add("tempo " + juce::String(bpm));
        tempo = bpm;
    }
    
    void setEmphasizeFirstBeat(bool b) override {
        calls.add(juce::String("emphasize ") + (b ? "true" : "false"));
    }
    
    void setSound(bool b) override {
        calls.add(juce::String("sound ") + (b ? "true" : "false"));
    }
    
    void setPlaying(bool b) override {
        calls.add(juce::String("playing ") + (b ? "true" : "false"));
        playing = b;
    }

    juce::StringArray calls;
    int tempo = 0;
    bool playing = false;
};

/**
 * Beat light that records into a shared list so the order of
 * blinks across all eight lights can be checked.
 */
class RecordingIndicator : public BeatIndicator
{
  public:

    RecordingIndicator() {}
    
    void init(int b, std::vector<int>* log) {
        beat = b;
        blinks = log;
    }
    
    void blink() override {
        count++;
        if (blinks != nullptr)
          blinks->push_back(beat);
    }

    int count = 0;
    
  private:

    int beat = 0;
    std::vector<int>* blinks = nullptr;
};
