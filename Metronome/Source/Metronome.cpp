
#include <juce_core/juce_core.h>

#include "util/Trace.h"
#include "model/Tempo.h"
#include "model/BeatLayout.h"
#include "model/MetronomeConfig.h"
#include "model/MetronomeState.h"
#include "sync/ControlSequence.h"
#include "sync/ClockService.h"
#include "ui/BeatIndicator.h"

#include "Metronome.h"

Metronome::Metronome(ControlSequence* cs) :
    tickMaster(cs, &dispatcher)
{
    sequence = cs;
    selfReference = this;
    applyConfig();
    tickMaster.reset();
}

Metronome::~Metronome()
{
    if (attached)
      detach();
}

//////////////////////////////////////////////////////////////////////
//
// Configuration and Lifecycle
//
//////////////////////////////////////////////////////////////////////

void Metronome::loadConfig(MetronomeConfig* c)
{
    if (c == nullptr) {
        Trace(1, "Metronome: loadConfig with no configuration");
    }
    else {
        config = *c;
        TraceLevel = config.traceLevel;
        applyConfig();
    }
}

void Metronome::applyConfig()
{
    tapper.setWindow(config.tapWindow);
    tapper.setCeiling(config.maxTempo);
    tickMaster.loadConfig(&config);
}

void Metronome::setIndicator(int beat, BeatIndicator* indicator)
{
    dispatcher.setIndicator(beat, indicator);
}

void Metronome::attach()
{
    if (attached) {
        Trace(2, "Metronome: Already attached");
    }
    else {
        tickMaster.reset();
        tapper.reset();
        attached = true;
        Trace(2, "Metronome: Attached");
    }
}

void Metronome::detach()
{
    if (!attached) {
        Trace(2, "Metronome: Not attached");
    }
    else {
        tickMaster.shutdown();
        tapper.reset();
        attached = false;
        Trace(2, "Metronome: Detached");
    }
}

//////////////////////////////////////////////////////////////////////
//
// Tempo
//
//////////////////////////////////////////////////////////////////////

void Metronome::setTempo(int bpm)
{
    tickMaster.setTempo(bpm);
}

int Metronome::getTempo()
{
    return tickMaster.getTempo();
}

void Metronome::incrementTempo()
{
    tickMaster.incrementTempo();
}

void Metronome::decrementTempo()
{
    tickMaster.decrementTempo();
}

void Metronome::incrementTempoLarge()
{
    tickMaster.incrementTempoLarge();
}

void Metronome::decrementTempoLarge()
{
    tickMaster.decrementTempoLarge();
}

void Metronome::onTapTempo()
{
    onTapTempo((juce::int64)juce::Time::getMillisecondCounter());
}

void Metronome::onTapTempo(juce::int64 millis)
{
    int bpm = tapper.tap(millis);
    if (bpm > 0)
      tickMaster.setTempo(bpm);
}

//////////////////////////////////////////////////////////////////////
//
// Transport
//
//////////////////////////////////////////////////////////////////////

void Metronome::start()
{
    if (!attached)
      Trace(2, "Metronome: Start while detached");
    else
      tickMaster.start();
}

void Metronome::stop()
{
    tickMaster.stop();
}

void Metronome::startStop()
{
    if (tickMaster.isPlaying())
      stop();
    else
      start();
}

bool Metronome::isPlaying()
{
    return tickMaster.isPlaying();
}

//////////////////////////////////////////////////////////////////////
//
// Configuration Changes
//
//////////////////////////////////////////////////////////////////////

void Metronome::onConfigChanged(const BeatLayout& layout)
{
    tickMaster.setLayout(layout);
}

void Metronome::onConfigChanged(const Tempo& tempo)
{
    tickMaster.setTempo(tempo);
}

//////////////////////////////////////////////////////////////////////
//
// Clock Service
//
//////////////////////////////////////////////////////////////////////

void Metronome::onExternalConnected(ClockService* service)
{
    if (!attached)
      Trace(2, "Metronome: Clock service connected while detached");
    else
      tickMaster.connect(service);
}

void Metronome::onExternalDisconnected()
{
    tickMaster.disconnect();
}

ConnectionState Metronome::getConnectionState()
{
    return tickMaster.getConnectionState();
}

/**
 * While detached nobody is listening for ticks, these are dropped
 * rather than blinking lights that aren't showing.
 */
void Metronome::onExternalTick(int beat)
{
    if (attached)
      tickMaster.externalTick(beat);
}

/**
 * This one can come from anywhere.  The attached check has to wait until
 * we're on the control thread, a tick posted just before detach arrives
 * after it and is dropped.
 */
void Metronome::postExternalTick(int beat)
{
    if (sequence->isControlThread()) {
        onExternalTick(beat);
    }
    else {
        juce::WeakReference<Metronome> ref = selfReference;
        sequence->post([ref, beat]() {
            Metronome* metronome = ref.get();
            if (metronome != nullptr)
              metronome->onExternalTick(beat);
        });
    }
}

void Metronome::refreshState(MetronomeState* state)
{
    tickMaster.refreshState(state);
}
