/**
 * Configuration for the metronome core.
 *
 * Stored as XML in this format:
 *
 * <MetronomeConfig maxTempo='400' defaultTempo='100'
 *                  tapWindow='5000' largeStep='10' traceLevel='2'>
 *   <BeatLayout beats='4' subdivisions='1' gaps='3,4'
 *               emphasizeFirstBeat='true' sound='true'/>
 * </MetronomeConfig>
 *
 * Everything is optional.  Values that are out of range are corrected
 * and a message is left in the error list, a bad file never prevents
 * the metronome from running.
 *
 * The layout here is only the starting layout, it is copied into the
 * live state every time the metronome is attached.
 */

#pragma once

#include <juce_core/juce_core.h>

#include "Tempo.h"
#include "BeatLayout.h"

class MetronomeConfig
{
  public:

    constexpr static const char* XmlName = "MetronomeConfig";
    constexpr static const char* LayoutXmlName = "BeatLayout";

    static constexpr int DefaultTapWindow = 5000;
    static constexpr int DefaultLargeStep = 10;
    static constexpr int DefaultTraceLevel = 2;
    
    MetronomeConfig() {}
    ~MetronomeConfig() {}

    int maxTempo = Tempo::Max;
    int defaultTempo = Tempo::Default;

    // milliseconds of tap history used for tap tempo
    int tapWindow = DefaultTapWindow;

    // number of unit steps in a large tempo change
    int largeStep = DefaultLargeStep;

    int traceLevel = DefaultTraceLevel;

    BeatLayout layout;

    void parseXml(juce::String xml, juce::StringArray& errors);
    juce::String toXml();

    bool load(juce::File file, juce::StringArray& errors);

  private:

    void parseLayout(juce::XmlElement* el, juce::StringArray& errors);
    void renderLayout(juce::XmlElement* parent);
    void validate(juce::StringArray& errors);
    int checkRange(const char* name, int value, int min, int max, juce::StringArray& errors);
    
};
