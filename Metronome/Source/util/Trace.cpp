/*
 * Trace utilities.
 *
 * The old implementation accumulated records in a ring buffer so they
 * could be flushed outside the audio interrupt.  Nothing here runs in an
 * interrupt, the worst we have is the external clock delivering a tick
 * from its own thread, so records are rendered and emitted immediately
 * under a lock.
 *
 * Output goes to stdout when TraceToStdout is set, and to the debug
 * output stream through juce::Logger when TraceToDebug is set.
 * If a TraceListener is registered it receives every rendered message.
 */

#include <juce_core/juce_core.h>

#include <stdio.h>
#include <stdarg.h>
#include <string.h>

#include "Trace.h"

/****************************************************************************
 *                                                                          *
 *   							    OUTPUT                                  *
 *                                                                          *
 ****************************************************************************/

bool TraceToDebug = true;
bool TraceToStdout = false;

int TraceLevel = 2;

TraceListener* GlobalTraceListener = nullptr;

/**
 * Csect for emission, trace can come from more than one thread.
 */
juce::CriticalSection TraceCriticalSection;

// internal method that deals with a single char array
static void traceInternal(const char* buf)
{
    const juce::ScopedLock lock (TraceCriticalSection);
    
	if (TraceToStdout) {
		printf("%s", buf);
		fflush(stdout);
	}

	if (TraceToDebug) {
        // Logger adds its own newline
        juce::String s(buf);
        juce::Logger::outputDebugString(s.trimEnd());
	}

    if (GlobalTraceListener != nullptr)
      GlobalTraceListener->traceEmit(buf);
}

/****************************************************************************
 *                                                                          *
 *   							  RENDERING                                 *
 *                                                                          *
 ****************************************************************************/

/**
 * Called for every string argument to make sure that it has a value,
 * a null would crash the formatter.
 */
static const char* CheckString(const char* arg)
{
    if (arg == nullptr)
      arg = "";
    return arg;
}

/**
 * Render a leveled message and emit it.
 * The level check happens before any formatting so filtered trace
 * costs almost nothing.
 */
static void TraceFormat(int level, const char* msg, ...)
{
    if (level > TraceLevel)
      return;

    if (msg == nullptr || strlen(msg) == 0)
      msg = "!!!!!! MISSING TRACE MESSAGE !!!!!!";

    char buffer[MAX_TRACE_MSG];
    size_t prefix = 0;
    if (level == 1) {
        strcpy(buffer, "ERROR: ");
        prefix = strlen(buffer);
    }
    
    va_list args;
    va_start(args, msg);
    vsnprintf(buffer + prefix, sizeof(buffer) - prefix - 1, msg, args);
    va_end(args);

    // this is so easy to miss
    size_t len = strlen(buffer);
    if (len == 0 || buffer[len-1] != '\n') {
        buffer[len] = '\n';
        buffer[len+1] = 0;
    }

    traceInternal(buffer);
}

/****************************************************************************
 *                                                                          *
 *   							TRACE METHODS                               *
 *                                                                          *
 ****************************************************************************/

void Trace(int level, const char* msg)
{
    // no arguments, don't let a stray % in the message confuse the formatter
    TraceFormat(level, "%s", CheckString(msg));
}

void Trace(int level, const char* msg, const char* arg)
{
    TraceFormat(level, msg, CheckString(arg));
}

void Trace(int level, const char* msg, const char* arg, const char* arg2)
{
    TraceFormat(level, msg, CheckString(arg), CheckString(arg2));
}

void Trace(int level, const char* msg, const char* arg, const char* arg2, const char* arg3)
{
    TraceFormat(level, msg, CheckString(arg), CheckString(arg2), CheckString(arg3));
}

void Trace(int level, const char* msg, const char* arg, long l1)
{
    TraceFormat(level, msg, CheckString(arg), l1);
}

void Trace(int level, const char* msg, const char* arg, long l1, long l2)
{
    TraceFormat(level, msg, CheckString(arg), l1, l2);
}

void Trace(int level, const char* msg, const char* arg, const char* arg2, long l1)
{
    TraceFormat(level, msg, CheckString(arg), CheckString(arg2), l1);
}

void Trace(int level, const char* msg, long l1)
{
    TraceFormat(level, msg, l1);
}

void Trace(int level, const char* msg, long l1, long l2)
{
    TraceFormat(level, msg, l1, l2);
}

void Trace(int level, const char* msg, long l1, long l2, long l3)
{
    TraceFormat(level, msg, l1, l2, l3);
}

void Trace(int level, const char* msg, long l1, long l2, long l3, long l4)
{
    TraceFormat(level, msg, l1, l2, l3, l4);
}
