
#include <juce_core/juce_core.h>

#include "../util/Trace.h"

#include "Tempo.h"
#include "BeatLayout.h"
#include "MetronomeConfig.h"

/**
 * Tap windows shorter than this can't hold two taps at any
 * usable tempo, longer ones just make tap tempo sluggish.
 */
const int MetronomeMinTapWindow = 100;
const int MetronomeMaxTapWindow = 60000;

const int MetronomeMaxLargeStep = 100;

//////////////////////////////////////////////////////////////////////
//
// XML Parsing
//
//////////////////////////////////////////////////////////////////////

bool MetronomeConfig::load(juce::File file, juce::StringArray& errors)
{
    bool loaded = false;
    if (!file.existsAsFile()) {
        errors.add(juce::String("MetronomeConfig: File not found: ") + file.getFullPathName());
    }
    else {
        int before = errors.size();
        parseXml(file.loadFileAsString(), errors);
        loaded = (errors.size() == before);
    }
    return loaded;
}

void MetronomeConfig::parseXml(juce::String xml, juce::StringArray& errors)
{
    int firstError = errors.size();
    
    juce::XmlDocument doc(xml);
    std::unique_ptr<juce::XmlElement> root = doc.getDocumentElement();
    if (root == nullptr) {
        errors.add(juce::String("MetronomeConfig: Parse error: ") + doc.getLastParseError());
    }
    else if (!root->hasTagName(XmlName)) {
        errors.add(juce::String("MetronomeConfig: Unexpected XML tag name: ") + root->getTagName());
    }
    else {
        maxTempo = root->getIntAttribute("maxTempo", Tempo::Max);
        defaultTempo = root->getIntAttribute("defaultTempo", Tempo::Default);
        tapWindow = root->getIntAttribute("tapWindow", DefaultTapWindow);
        largeStep = root->getIntAttribute("largeStep", DefaultLargeStep);
        traceLevel = root->getIntAttribute("traceLevel", DefaultTraceLevel);

        for (auto* el : root->getChildIterator()) {
            if (el->hasTagName(LayoutXmlName)) {
                parseLayout(el, errors);
            }
            else {
                errors.add(juce::String("MetronomeConfig: Unexpected XML tag name: ") +
                           el->getTagName());
            }
        }

        validate(errors);
    }

    for (int i = firstError ; i < errors.size() ; i++)
      Trace(1, "%s", errors[i].toRawUTF8());
}

void MetronomeConfig::parseLayout(juce::XmlElement* el, juce::StringArray& errors)
{
    BeatLayout defaults;
    
    int beats = el->getIntAttribute("beats", defaults.getBeats());
    int subdivisions = el->getIntAttribute("subdivisions", defaults.getSubdivisions());
    
    beats = checkRange("beats", beats, BeatLayout::MinBeats, BeatLayout::MaxBeats, errors);
    subdivisions = checkRange("subdivisions", subdivisions,
                              BeatLayout::MinSubdivisions, BeatLayout::MaxSubdivisions, errors);

    juce::SortedSet<int> gaps = BeatLayout::parseGaps(el->getStringAttribute("gaps"), errors);
    
    layout = BeatLayout()
        .withBeats(beats)
        .withSubdivisions(subdivisions)
        .withGaps(gaps)
        .withEmphasizeFirstBeat(el->getBoolAttribute("emphasizeFirstBeat", defaults.isEmphasizeFirstBeat()))
        .withSound(el->getBoolAttribute("sound", defaults.isSound()));
}

/**
 * Correct the top level values after parsing.
 * The ceiling has to be fixed before the default since the default
 * is checked against it.
 */
void MetronomeConfig::validate(juce::StringArray& errors)
{
    maxTempo = checkRange("maxTempo", maxTempo, Tempo::Min, Tempo::Max, errors);
    defaultTempo = checkRange("defaultTempo", defaultTempo, Tempo::Min, maxTempo, errors);
    tapWindow = checkRange("tapWindow", tapWindow, MetronomeMinTapWindow, MetronomeMaxTapWindow, errors);
    largeStep = checkRange("largeStep", largeStep, 1, MetronomeMaxLargeStep, errors);
    
    // zero turns everything off which is allowed
    traceLevel = checkRange("traceLevel", traceLevel, 0, 4, errors);
}

int MetronomeConfig::checkRange(const char* name, int value, int min, int max,
                                juce::StringArray& errors)
{
    int corrected = value;
    if (value < min)
      corrected = min;
    else if (value > max)
      corrected = max;

    if (corrected != value) {
        errors.add(juce::String("MetronomeConfig: Correcting ") + name + " " +
                   juce::String(value) + " to " + juce::String(corrected));
    }
    return corrected;
}

//////////////////////////////////////////////////////////////////////
//
// XML Rendering
//
//////////////////////////////////////////////////////////////////////

juce::String MetronomeConfig::toXml()
{
    juce::XmlElement root (XmlName);

    root.setAttribute("maxTempo", maxTempo);
    root.setAttribute("defaultTempo", defaultTempo);
    root.setAttribute("tapWindow", tapWindow);
    root.setAttribute("largeStep", largeStep);
    
    if (traceLevel != DefaultTraceLevel)
      root.setAttribute("traceLevel", traceLevel);

    renderLayout(&root);
    
    return root.toString();
}

void MetronomeConfig::renderLayout(juce::XmlElement* parent)
{
    juce::XmlElement* el = new juce::XmlElement(LayoutXmlName);
    parent->addChildElement(el);

    el->setAttribute("beats", layout.getBeats());
    el->setAttribute("subdivisions", layout.getSubdivisions());
    if (layout.getGaps().size() > 0)
      el->setAttribute("gaps", layout.getGapString());
    el->setAttribute("emphasizeFirstBeat", layout.isEmphasizeFirstBeat());
    el->setAttribute("sound", layout.isSound());
}
