/*
 * Trace utilities.
 *
 * Use Trace(1,... for errors and Trace(2,... for things worth knowing
 * about.  Higher levels are debugging noise and are normally filtered.
 *
 * Ticks from the external clock may be traced from a thread other than
 * the control thread so emission is serialized.
 */

#ifndef TRACE_H
#define TRACE_H

#include <juce_core/juce_core.h>

/****************************************************************************
 *                                                                          *
 *   							    OUTPUT                                  *
 *                                                                          *
 ****************************************************************************/

extern bool TraceToDebug;
extern bool TraceToStdout;

/****************************************************************************
 *                                                                          *
 *   							 TRACE LEVELS                               *
 *                                                                          *
 ****************************************************************************/

/**
 * Trace records at this level or lower are emitted.
 * 1 is errors, 2 is informational, anything higher is debug.
 */
extern int TraceLevel;

/**
 * Interface of an object to receive trace messages as they
 * are emitted.  Used by tests that want to see what was said.
 */
class TraceListener {
  public:
    virtual ~TraceListener() {}
    virtual void traceEmit(const char* msg) = 0;
};    

/**
 * The one global listener.
 */
extern TraceListener* GlobalTraceListener;

#define MAX_TRACE_MSG 1024

/****************************************************************************
 *                                                                          *
 *   						   TRACE FUNCTIONS                              *
 *                                                                          *
 ****************************************************************************/

// Arguments follow the old convention: up to three strings first, then
// up to four longs.  Format strings must use %ld for the longs.

void Trace(int level, const char* msg);
void Trace(int level, const char* msg, const char* arg);
void Trace(int level, const char* msg, const char* arg, const char* arg2);
void Trace(int level, const char* msg, const char* arg, const char* arg2, const char* arg3);
void Trace(int level, const char* msg, const char* arg, long l1);
void Trace(int level, const char* msg, const char* arg, long l1, long l2);
void Trace(int level, const char* msg, const char* arg, const char* arg2, long l1);
void Trace(int level, const char* msg, long l1);
void Trace(int level, const char* msg, long l1, long l2);
void Trace(int level, const char* msg, long l1, long l2, long l3);
void Trace(int level, const char* msg, long l1, long l2, long l3, long l4);

#endif
