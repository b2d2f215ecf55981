/**
 * A metronome tempo in whole beats per minute.
 *
 * Tempos are values, once constructed they do not change.  Anything that wants
 * a different tempo makes a new one.  Construction clamps so a Tempo is always
 * within range and nothing downstream needs to check it again.
 *
 * The absolute range is Min to Max.  The configuration may lower the ceiling
 * but not raise it, the two argument constructor clamps to a lower ceiling.
 */

#pragma once

class Tempo
{
  public:

    static constexpr int Min = 1;
    static constexpr int Max = 400;
    static constexpr int Default = 100;

    static constexpr int MillisPerMinute = 60000;

    Tempo() {}
    explicit Tempo(int bpm);
    Tempo(int bpm, int ceiling);

    int getValue() const {
        return value;
    }

    /**
     * The length of one beat in milliseconds.
     * This is integer division so the effective tempo will be slightly
     * faster than requested at high tempos.  That is the same rounding
     * the audio clock uses so the two sources agree.
     */
    int getBeatMillis() const {
        return MillisPerMinute / value;
    }

    bool operator==(const Tempo& other) const {
        return value == other.value;
    }

    bool operator!=(const Tempo& other) const {
        return value != other.value;
    }

    static int clamp(int bpm, int ceiling = Max);
    static int fromMillis(int beatMillis);
    
  private:

    int value = Default;
};
