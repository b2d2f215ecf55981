/**
 * Command line host for the metronome core.
 *
 * This is mostly for trying things out without the real UI or the audio
 * clock process.  The --run command drives the fallback ticker on a real
 * JUCE message loop and prints each beat as it would have been blinked.
 *
 *    metronome --run [--config=file] [--tempo=bpm] [--beats=n] [--seconds=n]
 *    metronome --tap=t1,t2,t3...
 *    metronome --dump [--config=file]
 */

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <stdio.h>

#include "util/Trace.h"
#include "model/Tempo.h"
#include "model/BeatLayout.h"
#include "model/MetronomeConfig.h"
#include "model/MetronomeState.h"
#include "sync/JuceControlSequence.h"
#include "sync/TapTempoMonitor.h"
#include "ui/BeatIndicator.h"
#include "ui/BeatDispatcher.h"
#include "Metronome.h"

/**
 * Stands in for a beat light.
 */
class ConsoleIndicator : public BeatIndicator
{
  public:

    void setBeat(int b) {
        beat = b;
    }

    void blink() override {
        juce::uint32 now = juce::Time::getMillisecondCounter();
        if (start == 0)
          start = now;
        printf("%8u  beat %d\n", (unsigned int)(now - start), beat);
        fflush(stdout);
    }

    // shared so all the lights print relative to the first blink
    static juce::uint32 start;
    
  private:

    int beat = 0;
};

juce::uint32 ConsoleIndicator::start = 0;

/**
 * Load the configuration named by --config if there was one.
 * A bad file is reported but we carry on with whatever was usable.
 */
static void loadConfig(const juce::ArgumentList& args, MetronomeConfig& config)
{
    if (args.containsOption("--config")) {
        juce::String path = args.getValueForOption("--config");
        if (path.isEmpty())
          juce::ConsoleApplication::fail("--config requires a file, use --config=file");
        
        juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(path);
        juce::StringArray errors;
        if (!config.load(file, errors)) {
            for (auto error : errors)
              fprintf(stderr, "%s\n", error.toRawUTF8());
            if (!file.existsAsFile())
              juce::ConsoleApplication::fail("Unable to read configuration");
        }
    }
}

static int getIntOption(const juce::ArgumentList& args, const char* option, int dflt)
{
    int value = dflt;
    if (args.containsOption(option)) {
        juce::String s = args.getValueForOption(option);
        if (!s.containsOnly("0123456789") || s.isEmpty())
          juce::ConsoleApplication::fail(juce::String(option) + " requires a number");
        value = s.getIntValue();
    }
    return value;
}

static void run(const juce::ArgumentList& args)
{
    MetronomeConfig config;
    loadConfig(args, config);

    int tempo = getIntOption(args, "--tempo", config.defaultTempo);
    int beats = getIntOption(args, "--beats", config.layout.getBeats());
    int seconds = getIntOption(args, "--seconds", 5);

    juce::ScopedJuceInitialiser_GUI init;
    JuceControlSequence sequence;
    Metronome metronome(&sequence);
    
    ConsoleIndicator lights[BeatDispatcher::MaxIndicators];
    for (int i = 0 ; i < BeatDispatcher::MaxIndicators ; i++) {
        lights[i].setBeat(i + 1);
        metronome.setIndicator(i + 1, &lights[i]);
    }

    metronome.loadConfig(&config);
    metronome.attach();
    metronome.setTempo(tempo);
    metronome.onConfigChanged(config.layout.withBeats(beats));

    printf("Tempo %d beats %d for %d seconds\n", metronome.getTempo(),
           BeatLayout::clampBeats(beats), seconds);
    
    metronome.start();
    juce::MessageManager::getInstance()->runDispatchLoopUntil(seconds * 1000);
    metronome.stop();

    MetronomeState state;
    metronome.refreshState(&state);
    printf("%d beats\n", state.fallbackTicks);
    
    metronome.detach();
}

static void tap(const juce::ArgumentList& args)
{
    juce::String csv = args.getValueForOption("--tap");
    juce::StringArray tokens = juce::StringArray::fromTokens(csv, ",", "");
    if (tokens.size() == 0)
      juce::ConsoleApplication::fail("--tap requires timestamps, use --tap=t1,t2,...");

    TapTempoMonitor monitor;
    int bpm = 0;
    for (auto token : tokens) {
        juce::String s = token.trim();
        if (s.isEmpty() || !s.containsOnly("0123456789"))
          juce::ConsoleApplication::fail(juce::String("Malformed timestamp: ") + s);
        
        int estimate = monitor.tap(s.getLargeIntValue());
        if (estimate > 0)
          bpm = estimate;
    }

    if (bpm > 0)
      printf("%d\n", bpm);
    else
      printf("No tempo\n");
}

static void dump(const juce::ArgumentList& args)
{
    MetronomeConfig config;
    loadConfig(args, config);
    printf("%s\n", config.toXml().toRawUTF8());
}

int main(int argc, char* argv[])
{
    TraceToStdout = false;
    TraceToDebug = true;
    
    juce::ConsoleApplication app;
    
    app.addHelpCommand("--help|-h", "Usage:", true);

    app.addCommand({ "--run",
                     "--run [--config=file] [--tempo=bpm] [--beats=n] [--seconds=n]",
                     "Run the fallback clock and print the beats", "",
                     run });

    app.addCommand({ "--tap",
                     "--tap=t1,t2,...",
                     "Estimate a tempo from tap timestamps in milliseconds", "",
                     tap });

    app.addCommand({ "--dump",
                     "--dump [--config=file]",
                     "Print the effective configuration", "",
                     dump });

    return app.findAndRunCommand(argc, argv);
}
