/**
 * Interface of the authoritative clock.
 *
 * This is the sound producing process that lives outside the core.  When it is
 * connected it owns the timing and sends ticks back through
 * TickMaster::postExternalTick.  The core pushes configuration into it through
 * these setters and never reads anything back.
 *
 * Setters are called on the control thread.  The implementation is
 * responsible for getting the values to wherever the audio is produced.
 */

#pragma once

#include <juce_core/juce_core.h>

class ClockService
{
  public:

    virtual ~ClockService() {}

    virtual void setBeats(int beats) = 0;
    virtual void setSubdivisions(int subdivisions) = 0;
    virtual void setGaps(const juce::SortedSet<int>& gaps) = 0;
    virtual void setTempo(int bpm) = 0;
    virtual void setEmphasizeFirstBeat(bool b) = 0;
    virtual void setSound(bool b) = 0;
    virtual void setPlaying(bool b) = 0;
    
};
