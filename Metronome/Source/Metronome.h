/**
 * The public face of the metronome core.
 *
 * A host creates one of these, gives it a ControlSequence, registers the
 * beat indicators, and calls attach() when it is ready to run.  After that
 * the UI calls the tempo and transport methods, and whatever manages the
 * audio clock process calls the onExternal methods as it comes and goes.
 *
 * This is a thin layer, the interesting decisions are all made in TickMaster.
 * What lives here is ownership of the pieces, the attach/detach lifecycle,
 * and tap tempo.
 */

#pragma once

#include <juce_core/juce_core.h>

#include "model/Tempo.h"
#include "model/BeatLayout.h"
#include "model/MetronomeConfig.h"
#include "sync/TickConstants.h"
#include "sync/TapTempoMonitor.h"
#include "sync/TickMaster.h"
#include "ui/BeatDispatcher.h"

class Metronome
{
  public:

    Metronome(class ControlSequence* cs);
    ~Metronome();

    //
    // Configuration and Lifecycle
    //

    /**
     * Copy the configuration.  Tempo bounds take effect immediately,
     * starting values on the next attach.
     */
    void loadConfig(MetronomeConfig* c);
    MetronomeConfig* getConfig() {
        return &config;
    }

    void setIndicator(int beat, class BeatIndicator* indicator);

    /**
     * Begin a fresh session with state from the configuration.
     */
    void attach();

    /**
     * End the session.  The fallback ticker is stopped and the clock
     * service is forgotten.
     */
    void detach();

    bool isAttached() {
        return attached;
    }

    //
    // Tempo
    //

    void setTempo(int bpm);
    int getTempo();
    
    void incrementTempo();
    void decrementTempo();
    void incrementTempoLarge();
    void decrementTempoLarge();

    /**
     * A tap on the tap tempo button using the current time.
     */
    void onTapTempo();

    /**
     * A tap with an explicit timestamp in milliseconds.
     */
    void onTapTempo(juce::int64 millis);

    //
    // Transport
    //

    void start();
    void stop();
    void startStop();
    bool isPlaying();

    //
    // Configuration changes from the UI
    //

    void onConfigChanged(const BeatLayout& layout);
    void onConfigChanged(const Tempo& tempo);

    //
    // Clock service lifecycle and ticks
    //

    void onExternalConnected(class ClockService* service);
    void onExternalDisconnected();
    ConnectionState getConnectionState();

    // on the control thread
    void onExternalTick(int beat);

    // from any thread, delivered to onExternalTick on the control thread
    void postExternalTick(int beat);

    void refreshState(class MetronomeState* state);

    TickMaster* getTickMaster() {
        return &tickMaster;
    }

  private:

    class ControlSequence* sequence = nullptr;
    MetronomeConfig config;
    BeatDispatcher dispatcher;
    TapTempoMonitor tapper;
    TickMaster tickMaster;
    bool attached = false;

    // made on construction so postExternalTick can copy it from any thread
    juce::WeakReference<Metronome> selfReference;

    void applyConfig();

    JUCE_DECLARE_WEAK_REFERENCEABLE(Metronome)
    JUCE_DECLARE_NON_COPYABLE(Metronome)
};
