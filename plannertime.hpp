//
//  plannertime.hpp
//  planner
//
//  Zeitzone, Zeitstempel und lokale Kalendertage
//

#ifndef plannertime_hpp
#define plannertime_hpp

#include <time.h>
#include <string>

bool SetTimezone(const char *tz);

// UTC, GMT oder Eintrag unter /usr/share/zoneinfo, ändert TZ nicht
bool KnownTimezone(const char *tz);

// TZ für einen Lauf setzen, beim Verlassen den vorherigen Wert wiederherstellen
class TimezoneScope
{
public:
    explicit TimezoneScope(const char *tz);
    ~TimezoneScope();

private:
    TimezoneScope(const TimezoneScope &);
    TimezoneScope &operator=(const TimezoneScope &);
    std::string old_tz;
    bool had_tz;
};

int DaysFromCivil(int y, int m, int d);
void CivilFromDays(int z, int &y, int &m, int &d);

// lokale Wanduhrzeit -> UTC, DST vor Normalzeit
time_t LocalToUtc(int y, int mo, int d, int h, int mi, int s);

int LocalDay(time_t t);         // lokale Tagesnummer seit 1970-01-01
int LocalHour(time_t t);
time_t DayStart(int day);       // lokale Mitternacht
time_t FloorSlot(time_t t);

// ISO-8601 mit Offset oder Z, lokale Zeit ohne Offset, Unix Sekunden
bool ParseTimestamp(const char *s, time_t &t);
bool ParseDay(const char *s, int &day);

std::string FormatTimestamp(time_t t);
std::string FormatDay(int day);

#endif /* plannertime_hpp */
