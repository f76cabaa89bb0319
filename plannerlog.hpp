//
//  plannerlog.hpp
//  planner
//

#ifndef plannerlog_hpp
#define plannerlog_hpp

#include <stdio.h>
#include <stdarg.h>

enum {LOGERROR = 0, LOGWARN, LOGINFO, LOGDEBUG};

extern char Log[3000];

// logfile: Basisname, leer = nur Konsole
void LogInit(const char *logfile, bool debug);
void LogQuiet(bool quiet);
bool LogDebug();

int WriteLog(int level, const char *fmt, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 2, 3)))
#endif
    ;

#endif /* plannerlog_hpp */
