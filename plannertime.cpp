//
//  plannertime.cpp
//  planner
//

#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <sys/stat.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>

bool KnownTimezone(const char *tz)
{
    char fname[256];
    struct stat st;
    if (tz == NULL || strlen(tz) == 0)
        return false;
    if (strcmp(tz, "UTC") == 0 || strcmp(tz, "GMT") == 0)
        return true;
    if (tz[0] == '/' || strstr(tz, "..") != NULL)
        return false;
    snprintf(fname, sizeof(fname), "/usr/share/zoneinfo/%s", tz);
    return stat(fname, &st) == 0 && S_ISREG(st.st_mode);
}

bool SetTimezone(const char *tz)
{
    if (tz == NULL || strlen(tz) == 0)
        return false;
    setenv("TZ", tz, 1);
    tzset();
    if (not KnownTimezone(tz))
    {
        WriteLog(LOGWARN, "Zeitzone %s nicht gefunden, verwende UTC", tz);
        return false;
    }
    return true;
}

TimezoneScope::TimezoneScope(const char *tz)
{
    const char *old = getenv("TZ");
    had_tz = old != NULL;
    if (had_tz)
        old_tz = old;
    SetTimezone(tz);
}

TimezoneScope::~TimezoneScope()
{
    if (had_tz)
        setenv("TZ", old_tz.c_str(), 1);
    else
        unsetenv("TZ");
    tzset();
}

// proleptischer gregorianischer Kalender
int DaysFromCivil(int y, int m, int d)
{
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void CivilFromDays(int z, int &y, int &m, int &d)
{
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y = yoe + era * 400 + (m <= 2);
}

static bool Matches(time_t t, int y, int mo, int d, int h, int mi)
{
    struct tm ltm;
    localtime_r(&t, &ltm);
    return ltm.tm_year + 1900 == y && ltm.tm_mon + 1 == mo && ltm.tm_mday == d
        && ltm.tm_hour == h && ltm.tm_min == mi;
}

time_t LocalToUtc(int y, int mo, int d, int h, int mi, int s)
{
    struct tm ltm;
    time_t t;
    // doppelte Stunde: Sommerzeit zuerst, dann Normalzeit
    for (int isdst = 1; isdst >= 0; isdst--)
    {
        memset(&ltm, 0, sizeof(ltm));
        ltm.tm_year = y - 1900;
        ltm.tm_mon = mo - 1;
        ltm.tm_mday = d;
        ltm.tm_hour = h;
        ltm.tm_min = mi;
        ltm.tm_sec = s;
        ltm.tm_isdst = isdst;
        t = mktime(&ltm);
        if (t != (time_t)-1 && Matches(t, y, mo, d, h, mi))
            return t;
    }
    // Uhrzeit existiert nicht (Zeitumstellung), mktime verschiebt sie
    memset(&ltm, 0, sizeof(ltm));
    ltm.tm_year = y - 1900;
    ltm.tm_mon = mo - 1;
    ltm.tm_mday = d;
    ltm.tm_hour = h;
    ltm.tm_min = mi;
    ltm.tm_sec = s;
    ltm.tm_isdst = -1;
    return mktime(&ltm);
}

int LocalDay(time_t t)
{
    struct tm ltm;
    localtime_r(&t, &ltm);
    return DaysFromCivil(ltm.tm_year + 1900, ltm.tm_mon + 1, ltm.tm_mday);
}

int LocalHour(time_t t)
{
    struct tm ltm;
    localtime_r(&t, &ltm);
    return ltm.tm_hour;
}

time_t DayStart(int day)
{
    int y, m, d;
    CivilFromDays(day, y, m, d);
    return LocalToUtc(y, m, d, 0, 0, 0);
}

time_t FloorSlot(time_t t)
{
    return t - ((t % SLOTSECONDS) + SLOTSECONDS) % SLOTSECONDS;
}

bool ParseTimestamp(const char *s, time_t &t)
{
    int y, mo, d, h = 0, mi = 0, sec = 0;
    int pos = 0;
    if (s == NULL)
        return false;
    while (isspace((unsigned char)*s)) s++;
    if (sscanf(s, "%d-%d-%d%n", &y, &mo, &d, &pos) != 3)
    {
        // Unix Sekunden oder Millisekunden
        char *end = NULL;
        double v = strtod(s, &end);
        if (end == s || *end != 0)
            return false;
        if (v > 1e11)
            v = v / 1000;
        t = (time_t)v;
        return true;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31)
        return false;
    const char *p = s + pos;
    if (*p == 'T' || *p == ' ')
    {
        int n = 0;
        if (sscanf(p + 1, "%d:%d%n", &h, &mi, &n) != 2)
            return false;
        p += 1 + n;
        if (*p == ':')
        {
            double fs = 0;
            n = 0;
            if (sscanf(p + 1, "%lf%n", &fs, &n) != 1)
                return false;
            sec = (int)fs;
            p += 1 + n;
        }
    }
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0 || sec > 60)
        return false;
    while (*p == ' ') p++;
    if (*p == 0)
    {
        t = LocalToUtc(y, mo, d, h, mi, sec);
        return true;
    }
    long offset = 0;
    if (*p == 'Z' || *p == 'z')
        offset = 0;
    else if (*p == '+' || *p == '-')
    {
        int oh = 0, om = 0;
        int sign = (*p == '-') ? -1 : 1;
        if (sscanf(p + 1, "%2d:%2d", &oh, &om) != 2 && sscanf(p + 1, "%2d%2d", &oh, &om) < 1)
            return false;
        offset = sign * (oh * 3600L + om * 60L);
    }
    else
        return false;
    t = (time_t)DaysFromCivil(y, mo, d) * 86400 + h * 3600 + mi * 60 + sec - offset;
    return true;
}

bool ParseDay(const char *s, int &day)
{
    int y, m, d;
    if (s == NULL || sscanf(s, "%d-%d-%d", &y, &m, &d) != 3)
        return false;
    if (m < 1 || m > 12 || d < 1 || d > 31)
        return false;
    day = DaysFromCivil(y, m, d);
    return true;
}

std::string FormatTimestamp(time_t t)
{
    struct tm ltm;
    char buf[40];
    char zone[8];
    localtime_r(&t, &ltm);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &ltm);
    strftime(zone, sizeof(zone), "%z", &ltm);
    // +0100 -> +01:00
    std::string s = buf;
    if (strlen(zone) == 5)
    {
        s += std::string(zone, 3);
        s += ":";
        s += std::string(zone + 3, 2);
    }
    else
        s += "Z";
    return s;
}

std::string FormatDay(int day)
{
    int y, m, d;
    char buf[16];
    CivilFromDays(day, y, m, d);
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return buf;
}
