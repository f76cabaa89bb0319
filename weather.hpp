//
//  weather.hpp
//  planner
//
//  Tagesmitteltemperatur von open-meteo
//

#ifndef weather_hpp
#define weather_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include "sindex.hpp"
#include <map>
#include <vector>

// Antwort mit daily.time / daily.temperature_2m_mean, Schlüssel ist der Tagesoffset zu today
bool ParseTemperatures(const char *json, int today, const std::vector<int> &offsets, std::map<int, float> &temps);

// curl mit max. 30s Wartezeit, leer bei Fehler
std::map<int, float> FetchTemperatures(const planner_config_t &cfg, int today, const std::vector<int> &offsets);

// Temperaturen aus dem Snapshot, sonst open-meteo wenn konfiguriert
tempfetch_t MakeTempFetcher(const planner_config_t &cfg, const snapshot_s &snap, int today);

#endif /* weather_hpp */
