
#include <juce_core/juce_core.h>

#include "../util/Trace.h"

#include "BeatLayout.h"

/**
 * Used both when building a layout and by the fallback ticker which
 * treats a missing beat count as the default.
 */
int BeatLayout::clampBeats(int n)
{
    if (n < MinBeats)
      n = MinBeats;
    else if (n > MaxBeats)
      n = MaxBeats;
    return n;
}

BeatLayout BeatLayout::withBeats(int n) const
{
    BeatLayout copy = *this;
    copy.beats = clampBeats(n);
    return copy;
}

BeatLayout BeatLayout::withSubdivisions(int n) const
{
    BeatLayout copy = *this;
    if (n < MinSubdivisions)
      n = MinSubdivisions;
    else if (n > MaxSubdivisions)
      n = MaxSubdivisions;
    copy.subdivisions = n;
    return copy;
}

/**
 * Gaps outside the beat range are dropped.  Gaps beyond the current beat count
 * are kept, they come back into play if the beat count is raised again.
 */
BeatLayout BeatLayout::withGaps(const juce::SortedSet<int>& g) const
{
    BeatLayout copy = *this;
    copy.gaps.clear();
    for (auto beat : g) {
        if (beat >= MinBeats && beat <= MaxBeats)
          copy.gaps.add(beat);
        else
          Trace(2, "BeatLayout: Ignoring gap out of range %ld", (long)beat);
    }
    return copy;
}

BeatLayout BeatLayout::withEmphasizeFirstBeat(bool b) const
{
    BeatLayout copy = *this;
    copy.emphasizeFirstBeat = b;
    return copy;
}

BeatLayout BeatLayout::withSound(bool b) const
{
    BeatLayout copy = *this;
    copy.sound = b;
    return copy;
}

bool BeatLayout::operator==(const BeatLayout& other) const
{
    return (beats == other.beats &&
            subdivisions == other.subdivisions &&
            gaps == other.gaps &&
            emphasizeFirstBeat == other.emphasizeFirstBeat &&
            sound == other.sound);
}

juce::String BeatLayout::getGapString() const
{
    juce::StringArray tokens;
    for (auto beat : gaps)
      tokens.add(juce::String(beat));
    return tokens.joinIntoString(",");
}

juce::SortedSet<int> BeatLayout::parseGaps(juce::String csv, juce::StringArray& errors)
{
    juce::SortedSet<int> result;
    juce::StringArray tokens = juce::StringArray::fromTokens(csv, ",", "");
    for (auto token : tokens) {
        juce::String trimmed = token.trim();
        if (trimmed.isEmpty()) {
            // tolerate "1,,2" and trailing commas
        }
        else if (!trimmed.containsOnly("0123456789")) {
            errors.add(juce::String("Malformed gap: ") + trimmed);
        }
        else {
            int beat = trimmed.getIntValue();
            if (beat < MinBeats || beat > MaxBeats)
              errors.add(juce::String("Gap out of range: ") + trimmed);
            else
              result.add(beat);
        }
    }
    return result;
}
