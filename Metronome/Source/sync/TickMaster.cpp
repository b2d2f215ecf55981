/**
 * Tick arbitration between the clock service and the fallback Ticker.
 *
 * All of these methods expect to be called on the ControlSequence thread
 * except postExternalTick.
 */

#include <juce_core/juce_core.h>

#include "../util/Trace.h"
#include "../model/Tempo.h"
#include "../model/BeatLayout.h"
#include "../model/MetronomeConfig.h"
#include "../model/MetronomeState.h"
#include "../ui/BeatDispatcher.h"

#include "ControlSequence.h"
#include "ClockService.h"
#include "Ticker.h"
#include "TickMaster.h"

//////////////////////////////////////////////////////////////////////
//
// Initialization
//
//////////////////////////////////////////////////////////////////////

TickMaster::TickMaster(ControlSequence* cs, BeatDispatcher* d) :
    ticker(this, cs)
{
    sequence = cs;
    dispatcher = d;
    selfReference = this;
}

TickMaster::~TickMaster()
{
    ticker.stop();
}

void TickMaster::loadConfig(MetronomeConfig* config)
{
    if (config == nullptr) {
        Trace(1, "TickMaster: loadConfig with no configuration");
    }
    else {
        int before = tempoKeeper.getTempo().getValue();
        tempoKeeper.setCeiling(config->maxTempo);
        tempoKeeper.setLargeStep(config->largeStep);
        defaultTempo = config->defaultTempo;
        defaultLayout = config->layout;

        // a lower ceiling may have pulled the live tempo down
        if (tempoKeeper.getTempo().getValue() != before)
          pushTempo();
    }
}

/**
 * Fresh state for a new attachment.
 * The connection is left alone, if a clock service is already connected
 * it gets the new state pushed to it.
 */
void TickMaster::reset()
{
    stopFallback();
    
    tempoKeeper.reset(defaultTempo);
    layout = defaultLayout;
    playing = false;
    lastBeat = 0;
    externalTicks = 0;
    fallbackTicks = 0;

    if (connection == ConnectionConnected)
      pushConfiguration();
}

void TickMaster::shutdown()
{
    stopFallback();
    playing = false;
    clockService = nullptr;
    connection = ConnectionDisconnected;
    traceTransition("Shutdown");
}

//////////////////////////////////////////////////////////////////////
//
// Tempo
//
//////////////////////////////////////////////////////////////////////

int TickMaster::getTempo()
{
    return tempoKeeper.getTempo().getValue();
}

bool TickMaster::setTempo(int bpm)
{
    bool changed = tempoKeeper.setTempo(bpm);
    if (changed)
      pushTempo();
    return changed;
}

bool TickMaster::setTempo(const Tempo& t)
{
    return setTempo(t.getValue());
}

bool TickMaster::incrementTempo()
{
    bool changed = tempoKeeper.increment();
    if (changed)
      pushTempo();
    return changed;
}

bool TickMaster::decrementTempo()
{
    bool changed = tempoKeeper.decrement();
    if (changed)
      pushTempo();
    return changed;
}

/**
 * The clock service only hears about the final value of a large step,
 * the intermediate unit steps are never observable outside.
 */
bool TickMaster::incrementTempoLarge()
{
    bool changed = tempoKeeper.incrementLarge();
    if (changed)
      pushTempo();
    return changed;
}

bool TickMaster::decrementTempoLarge()
{
    bool changed = tempoKeeper.decrementLarge();
    if (changed)
      pushTempo();
    return changed;
}

void TickMaster::pushTempo()
{
    if (connection == ConnectionConnected)
      clockService->setTempo(getTempo());
}

//////////////////////////////////////////////////////////////////////
//
// Layout
//
//////////////////////////////////////////////////////////////////////

void TickMaster::setLayout(const BeatLayout& neu)
{
    if (neu != layout) {
        BeatLayout old = layout;
        layout = neu;
        pushLayout(old);
    }
}

/**
 * Send the clock service the parts of the layout that changed.
 */
void TickMaster::pushLayout(const BeatLayout& old)
{
    if (connection == ConnectionConnected) {
        if (layout.getBeats() != old.getBeats())
          clockService->setBeats(layout.getBeats());
        
        if (layout.getSubdivisions() != old.getSubdivisions())
          clockService->setSubdivisions(layout.getSubdivisions());
        
        if (layout.getGaps() != old.getGaps())
          clockService->setGaps(layout.getGaps());
        
        if (layout.isEmphasizeFirstBeat() != old.isEmphasizeFirstBeat())
          clockService->setEmphasizeFirstBeat(layout.isEmphasizeFirstBeat());
        
        if (layout.isSound() != old.isSound())
          clockService->setSound(layout.isSound());
    }
}

/**
 * Push everything to a clock service that just connected so it adopts
 * our state rather than whatever it had.  Playing goes last so the
 * configuration is in place before the first tick of the session.
 */
void TickMaster::pushConfiguration()
{
    if (connection == ConnectionConnected) {
        clockService->setBeats(layout.getBeats());
        clockService->setSubdivisions(layout.getSubdivisions());
        clockService->setGaps(layout.getGaps());
        clockService->setTempo(getTempo());
        clockService->setEmphasizeFirstBeat(layout.isEmphasizeFirstBeat());
        clockService->setSound(layout.isSound());
        clockService->setPlaying(playing);
    }
}

//////////////////////////////////////////////////////////////////////
//
// Playing
//
//////////////////////////////////////////////////////////////////////

void TickMaster::start()
{
    if (playing) {
        Trace(3, "TickMaster: Already playing");
    }
    else {
        playing = true;
        traceTransition("Start");
        
        if (connection == ConnectionConnected)
          clockService->setPlaying(true);
        else
          startFallback();
    }
}

void TickMaster::stop()
{
    if (!playing) {
        Trace(3, "TickMaster: Already stopped");
    }
    else {
        playing = false;
        traceTransition("Stop");
        
        if (connection == ConnectionConnected)
          clockService->setPlaying(false);
        else
          stopFallback();
    }
}

//////////////////////////////////////////////////////////////////////
//
// Connection
//
//////////////////////////////////////////////////////////////////////

/**
 * The clock service is available.
 *
 * The Ticker is stopped before anything is pushed, pushing may start the
 * clock service playing and once that happens the Ticker must already be
 * gone.  Stopping an idle Ticker is harmless so this is unconditional.
 *
 * A different service replacing a connected one is told to stop first
 * for the same reason.
 */
void TickMaster::connect(ClockService* service)
{
    if (service == nullptr) {
        Trace(1, "TickMaster: connect with no service");
    }
    else if (connection == ConnectionConnected && service == clockService) {
        Trace(2, "TickMaster: Clock service already connected");
    }
    else {
        if (connection == ConnectionConnected) {
            // the old one must be quiet before the new one can start
            Trace(2, "TickMaster: Replacing connected clock service");
            if (playing)
              clockService->setPlaying(false);
        }
        
        connection = ConnectionConnected;
        clockService = service;
        stopFallback();
        pushConfiguration();
        traceTransition("Connect");
    }
}

/**
 * The clock service went away.
 *
 * If we were playing the Ticker takes over so the beat lights keep going
 * without sound rather than freezing.
 */
void TickMaster::disconnect()
{
    if (connection == ConnectionDisconnected) {
        Trace(2, "TickMaster: Clock service already disconnected");
    }
    else {
        connection = ConnectionDisconnected;
        clockService = nullptr;
        
        if (playing)
          startFallback();
        
        traceTransition("Disconnect");
    }
}

TickSource TickMaster::getLiveSource()
{
    TickSource source = TickSourceNone;
    if (playing) {
        if (connection == ConnectionConnected)
          source = TickSourceExternal;
        else
          source = TickSourceFallback;
    }
    return source;
}

bool TickMaster::isFallbackActive()
{
    return ticker.isActive();
}

void TickMaster::startFallback()
{
    if (connection == ConnectionConnected) {
        // the transitions should have prevented this
        Trace(1, "TickMaster: Attempt to start fallback while connected");
    }
    else {
        ticker.start();
    }
}

void TickMaster::stopFallback()
{
    ticker.stop();
}

void TickMaster::traceTransition(const char* event)
{
    Trace(2, "TickMaster: %s connection %s source %s", event,
          getConnectionStateName(connection), getTickSourceName(getLiveSource()));
}

//////////////////////////////////////////////////////////////////////
//
// Ticks
//
//////////////////////////////////////////////////////////////////////

/**
 * Ticks are passed along no matter where they came from.  The transitions
 * above keep the two sources from running at once so there is nothing
 * to filter here.
 */
void TickMaster::externalTick(int beat)
{
    if (connection != ConnectionConnected)
      Trace(2, "TickMaster: Tick from disconnected clock service %ld", (long)beat);
    
    externalTicks++;
    lastBeat = beat;
    if (dispatcher != nullptr)
      dispatcher->dispatch(beat);
}

void TickMaster::postExternalTick(int beat)
{
    if (sequence->isControlThread()) {
        externalTick(beat);
    }
    else {
        juce::WeakReference<TickMaster> ref = selfReference;
        sequence->post([ref, beat]() {
            TickMaster* master = ref.get();
            if (master != nullptr)
              master->externalTick(beat);
        });
    }
}

//////////////////////////////////////////////////////////////////////
//
// Ticker::Client
//
//////////////////////////////////////////////////////////////////////

bool TickMaster::isTickerEligible()
{
    return (playing && connection == ConnectionDisconnected);
}

int TickMaster::getTickerTempo()
{
    return getTempo();
}

int TickMaster::getTickerBeats()
{
    return layout.getBeats();
}

void TickMaster::tickerBeat(int beat)
{
    fallbackTicks++;
    lastBeat = beat;
    if (dispatcher != nullptr)
      dispatcher->dispatch(beat);
}

//////////////////////////////////////////////////////////////////////
//
// State
//
//////////////////////////////////////////////////////////////////////

void TickMaster::refreshState(MetronomeState* state)
{
    state->tempo = getTempo();
    state->layout = layout;
    state->playing = playing;
    state->connection = connection;
    state->source = getLiveSource();
    state->fallbackBeat = ticker.getBeat();
    state->lastBeat = lastBeat;
    state->externalTicks = externalTicks;
    state->fallbackTicks = fallbackTicks;
}
