/**
 * A set of enumerations for things in the tick model.
 */

#pragma once

/**
 * Whether the authoritative audio clock is reachable.
 * This changes only when the clock service connects or disconnects.
 */
typedef enum {

    ConnectionDisconnected,
    ConnectionConnected

} ConnectionState;

/**
 * Which producer is currently allowed to generate ticks.
 * This is derived from the ConnectionState and whether we are playing,
 * at most one of these is ever live.
 */
typedef enum {

    /**
     * Stopped, nothing is ticking.
     */
    TickSourceNone,

    /**
     * The external audio clock is connected and playing.
     */
    TickSourceExternal,

    /**
     * No clock service, the local ticker is substituting for it
     * without sound.
     */
    TickSourceFallback

} TickSource;

const char* getConnectionStateName(ConnectionState state);
const char* getTickSourceName(TickSource source);

/****************************************************************************/
/****************************************************************************/
/****************************************************************************/
