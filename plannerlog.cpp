//
//  plannerlog.cpp
//  planner
//

#include "plannerlog.hpp"
#include <sys/stat.h>
#include <string.h>
#include <time.h>
#include <mutex>

char Log[3000];

static char logname[128] = "";
static bool logdebug = false;
static bool logquiet = false;
static int log_alt = -1;    // Wochentag des letzten Eintrags

static const char *levelname[] = {"ERROR", "WARN", "INFO", "DEBUG"};

// Solver-Thread und Hauptthread schreiben beide
static std::mutex logmutex;

void LogInit(const char *logfile, bool debug)
{
    std::lock_guard<std::mutex> lock(logmutex);
    logname[0] = 0;
    if (logfile != NULL)
        snprintf(logname, sizeof(logname), "%s", logfile);
    logdebug = debug;
    log_alt = -1;
}

void LogQuiet(bool quiet)
{
    std::lock_guard<std::mutex> lock(logmutex);
    logquiet = quiet;
}

bool LogDebug()
{
    std::lock_guard<std::mutex> lock(logmutex);
    return logdebug;
}

// Logdatei je Wochentag, der Inhalt der Vorwoche wird verworfen
static void AppendLogfile(const char *line)
{
    time_t t;
    struct tm ltm;
    struct stat st;
    char fname[256];
    time(&t);
    localtime_r(&t, &ltm);
    snprintf(fname, sizeof(fname), "%s.%i.txt", logname, ltm.tm_wday);

    FILE *fp = NULL;
    if (log_alt != ltm.tm_wday)
    {
        // alte Datei der Vorwoche löschen
        if (stat(fname, &st) == 0 && t - st.st_mtime > 24 * 3600)
            fp = fopen(fname, "w");
        log_alt = ltm.tm_wday;
    }
    if (fp == NULL)
        fp = fopen(fname, "a");
    if (fp == NULL)
        return;
    char ts[32];
    strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &ltm);
    fprintf(fp, "%s %s\n", ts, line);
    fclose(fp);
}

int WriteLog(int level, const char *fmt, ...)
{
    std::lock_guard<std::mutex> lock(logmutex);
    if (level == LOGDEBUG && not logdebug)
        return 0;
    if (level < LOGERROR || level > LOGDEBUG)
        level = LOGINFO;
    char msg[2900];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    snprintf(Log, sizeof(Log), "[%s] %s", levelname[level], msg);

    if (level == LOGERROR)
        fprintf(stderr, "%s\n", Log);
    else if (not logquiet)
        printf("%s\n", Log);

    if (strlen(logname) > 0)
        AppendLogfile(Log);
    return 0;
}
