/**
 * The shape of a measure: how many beats, how each beat is subdivided,
 * which beats are silent, and whether the first beat is accented.
 *
 * Like Tempo this is a value.  The with() methods return a modified copy
 * and leave the original alone, a change to the layout replaces the whole thing.
 *
 * The fallback ticker only cares about beats.  Everything else is for the
 * audio clock which gets the whole layout pushed to it.
 */

#pragma once

#include <juce_core/juce_core.h>

class BeatLayout
{
  public:

    static constexpr int MinBeats = 1;
    static constexpr int MaxBeats = 8;
    static constexpr int DefaultBeats = 4;

    static constexpr int MinSubdivisions = 1;
    static constexpr int MaxSubdivisions = 4;

    BeatLayout() {}

    int getBeats() const {
        return beats;
    }

    int getSubdivisions() const {
        return subdivisions;
    }

    const juce::SortedSet<int>& getGaps() const {
        return gaps;
    }

    bool isGap(int beat) const {
        return gaps.contains(beat);
    }

    bool isEmphasizeFirstBeat() const {
        return emphasizeFirstBeat;
    }

    bool isSound() const {
        return sound;
    }

    BeatLayout withBeats(int n) const;
    BeatLayout withSubdivisions(int n) const;
    BeatLayout withGaps(const juce::SortedSet<int>& g) const;
    BeatLayout withEmphasizeFirstBeat(bool b) const;
    BeatLayout withSound(bool b) const;

    bool operator==(const BeatLayout& other) const;
    bool operator!=(const BeatLayout& other) const {
        return !(*this == other);
    }

    // gap lists are saved as csv, "2,4"
    juce::String getGapString() const;
    static juce::SortedSet<int> parseGaps(juce::String csv, juce::StringArray& errors);

    static int clampBeats(int n);
    
  private:

    int beats = DefaultBeats;
    int subdivisions = MinSubdivisions;
    juce::SortedSet<int> gaps;
    bool emphasizeFirstBeat = true;
    bool sound = true;
    
};
