/**
 * Something that can flash when a beat happens.
 *
 * In the application these are the eight beat lights.  Drawing them
 * is somebody else's problem, the core only ever calls blink().
 */

#pragma once

class BeatIndicator
{
  public:
    virtual ~BeatIndicator() {}
    virtual void blink() = 0;
};
