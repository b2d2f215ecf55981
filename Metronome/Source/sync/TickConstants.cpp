
#include "TickConstants.h"

const char* getConnectionStateName(ConnectionState state)
{
    const char* name = "???";
    switch (state) {
        case ConnectionDisconnected: name = "Disconnected"; break;
        case ConnectionConnected: name = "Connected"; break;
    }
    return name;
}

const char* getTickSourceName(TickSource source)
{
    const char* name = "???";
    switch (source) {
        case TickSourceNone: name = "None"; break;
        case TickSourceExternal: name = "External"; break;
        case TickSourceFallback: name = "Fallback"; break;
    }
    return name;
}
