/**
 * Snapshot of the observable metronome state.
 *
 * Filled in by TickMaster on request.  Hosts poll this to refresh
 * whatever they display, tests use it to check the state machine.
 */

#pragma once

#include "BeatLayout.h"
#include "../sync/TickConstants.h"

class MetronomeState
{
  public:

    int tempo = 0;
    BeatLayout layout;
    bool playing = false;
    ConnectionState connection = ConnectionDisconnected;
    TickSource source = TickSourceNone;

    // the next beat the fallback ticker will emit, zero when idle
    int fallbackBeat = 0;

    // the last beat sent to the dispatcher from either source
    int lastBeat = 0;

    // count of ticks from each source since attach
    int externalTicks = 0;
    int fallbackTicks = 0;
};
