
#include "Tempo.h"

Tempo::Tempo(int bpm)
{
    value = clamp(bpm);
}

Tempo::Tempo(int bpm, int ceiling)
{
    value = clamp(bpm, ceiling);
}

/**
 * Bring a raw bpm into range.
 * The ceiling itself is kept within the absolute range so a bad
 * configuration can't produce an invalid tempo.
 */
int Tempo::clamp(int bpm, int ceiling)
{
    if (ceiling > Max)
      ceiling = Max;
    else if (ceiling < Min)
      ceiling = Min;
    
    if (bpm < Min)
      bpm = Min;
    else if (bpm > ceiling)
      bpm = ceiling;
    
    return bpm;
}

/**
 * Convert a beat length to whole bpm.
 * Returns zero if the length is unusable, the caller decides what
 * to do about that.
 */
int Tempo::fromMillis(int beatMillis)
{
    int bpm = 0;
    if (beatMillis > 0)
      bpm = MillisPerMinute / beatMillis;
    return bpm;
}
