/**
 * Owner of the metronome's tick state and the one place where the decision
 * is made about who generates beats.
 *
 * There are two possible producers:
 *
 *    - the external audio clock, a ClockService that produces sound and sends
 *      ticks back to us asynchronously
 *    - the local Ticker which substitutes for it silently when it is not
 *      connected
 *
 * Which one is live is a function of two pieces of state that only
 * TickMaster changes:
 *
 *    ConnectionState   Connected while we have a ClockService, changed only
 *                      by connect() and disconnect()
 *    playing           changed only by start() and stop(), never inferred
 *                      from ticks arriving
 *
 *    Connected     + playing    -> the clock service ticks
 *    Disconnected  + playing    -> the Ticker ticks
 *    anything      + stopped    -> nothing ticks
 *
 * The transitions always stop the Ticker before anything else could start
 * so the two are never ticking at the same time.  This depends on everything
 * happening on the ControlSequence thread.  Ticks from the clock service
 * may arrive on some other thread and must come in through postExternalTick
 * which marshals them over.
 *
 * Tempo and layout live here too.  While connected every change is pushed to
 * the clock service as it happens.  The Ticker reads the current values on
 * every beat so it never needs to be told.
 */

#pragma once

#include <juce_core/juce_core.h>

#include "../model/Tempo.h"
#include "../model/TempoKeeper.h"
#include "../model/BeatLayout.h"

#include "TickConstants.h"
#include "Ticker.h"

class TickMaster : public Ticker::Client
{
  public:

    TickMaster(class ControlSequence* cs, class BeatDispatcher* d);
    ~TickMaster();

    /**
     * Adopt the tempo range and starting values from the configuration.
     * The live tempo is brought within the new range but otherwise the
     * starting values don't take effect until the next reset().
     */
    void loadConfig(class MetronomeConfig* config);

    /**
     * Start over with fresh state from the configuration.
     * Called whenever the metronome is attached.
     */
    void reset();

    /**
     * Stop everything and forget the clock service.
     * Called when the metronome is detached.
     */
    void shutdown();
    
    //
    // Tempo
    //

    int getTempo();
    bool setTempo(int bpm);
    bool setTempo(const Tempo& t);
    bool incrementTempo();
    bool decrementTempo();
    bool incrementTempoLarge();
    bool decrementTempoLarge();
    
    //
    // Layout
    //

    const BeatLayout& getLayout() {
        return layout;
    }
    
    void setLayout(const BeatLayout& neu);
    
    //
    // Playing
    //

    void start();
    void stop();
    bool isPlaying() {
        return playing;
    }

    //
    // Connection
    //

    void connect(class ClockService* service);
    void disconnect();

    ConnectionState getConnectionState() {
        return connection;
    }
    
    class ClockService* getClockService() {
        return clockService;
    }

    TickSource getLiveSource();
    bool isFallbackActive();

    //
    // Ticks
    //

    /**
     * A tick from the clock service.  Must be called on the control thread.
     */
    void externalTick(int beat);

    /**
     * A tick from the clock service on whatever thread it happened to
     * be delivered on.
     */
    void postExternalTick(int beat);

    void refreshState(class MetronomeState* state);

    //
    // Ticker::Client
    //

    bool isTickerEligible() override;
    int getTickerTempo() override;
    int getTickerBeats() override;
    void tickerBeat(int beat) override;
    
  private:

    class ControlSequence* sequence = nullptr;
    class BeatDispatcher* dispatcher = nullptr;

    // starting values from the configuration
    int defaultTempo = Tempo::Default;
    BeatLayout defaultLayout;
    
    TempoKeeper tempoKeeper;
    BeatLayout layout;
    bool playing = false;

    // clockService is non-null exactly when connection is Connected
    ConnectionState connection = ConnectionDisconnected;
    class ClockService* clockService = nullptr;

    Ticker ticker;

    // diagnostics for MetronomeState
    int lastBeat = 0;
    int externalTicks = 0;
    int fallbackTicks = 0;

    // made on construction so postExternalTick can copy it from any thread
    juce::WeakReference<TickMaster> selfReference;
    
    void pushConfiguration();
    void pushTempo();
    void pushLayout(const BeatLayout& old);
    void startFallback();
    void stopFallback();
    void traceTransition(const char* event);

    JUCE_DECLARE_WEAK_REFERENCEABLE(TickMaster)
    JUCE_DECLARE_NON_COPYABLE(TickMaster)
};

/****************************************************************************/
/****************************************************************************/
/****************************************************************************/
