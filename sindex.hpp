//
//  sindex.hpp
//  planner
//
//  S-Index: Lastzuschlag für die nächsten Tage und Risikofaktor für den Ziel-SoC
//

#ifndef sindex_hpp
#define sindex_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <functional>
#include <map>
#include <vector>

// Tagesoffsets -> Mitteltemperatur, leer bei Fehler
typedef std::function<std::map<int, float>(const std::vector<int> &offsets)> tempfetch_t;
typedef std::map<int, float> daytemps_t;

// einmal je Lauf: Offsets 1..horizon_days (mindestens Tag 2), leer ohne temp_weight
daytemps_t FetchDayTemperatures(const sindex_cfg_s &cfg, const tempfetch_t &fetch);

loadmargin_s CalcLoadMargin(const slotseries_t &series, const sindex_cfg_s &cfg, const dailyforecast_s &daily,
                            int today, const daytemps_t &temps);
loadmargin_s CalcProbabilisticMargin(const slotseries_t &series, const sindex_cfg_s &cfg,
                                     const dailyforecast_s &daily, int today);

void CalcRiskFactor(const slotseries_t &series, const sindex_cfg_s &cfg, int today, const daytemps_t &temps,
                    optval_s cloud_volatility, optval_s temp_volatility, riskfactors_s &rf);

float CalcTargetSoc(float raw_factor, float min_soc_percent, float capacity_kwh, const sindex_cfg_s &cfg,
                    float &target_kwh, float &base_buffer, float &weather_adj);

float TempAdjustment(float mean_temp, const sindex_cfg_s &cfg);

#endif /* sindex_hpp */
