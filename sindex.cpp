//
//  sindex.cpp
//  planner
//

#include "sindex.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include <algorithm>
#include <math.h>

typedef struct {float load; float pv; float load_p90; float pv_p10; bool bands; int n;} daysum_s;

// Summen der Rohprognose je lokalem Tag
static std::map<int, daysum_s> DaySums(const slotseries_t &series)
{
    std::map<int, daysum_s> sums;
    for (size_t j = 0; j < series.size(); j++)
    {
        const slot_s &s = series[j];
        int day = LocalDay(s.hh);
        std::map<int, daysum_s>::iterator it = sums.find(day);
        if (it == sums.end())
        {
            daysum_s d = {0, 0, 0, 0, false, 0};
            it = sums.insert(std::make_pair(day, d)).first;
        }
        daysum_s &d = it->second;
        d.load += s.load;
        d.pv += s.pv;
        d.load_p90 += OptOr(s.load_p90, s.load);
        d.pv_p10 += OptOr(s.pv_p10, s.pv);
        if (s.load_p90.set || s.pv_p10.set)
            d.bands = true;
        d.n++;
    }
    return sums;
}

static float MapValue(const dailymap_t &map, int day)
{
    dailymap_t::const_iterator it = map.find(day);
    return it == map.end() ? 0 : it->second;
}

float TempAdjustment(float mean_temp, const sindex_cfg_s &cfg)
{
    float span = cfg.temp_baseline - cfg.temp_cold;
    if (span <= 0)
        span = 1;
    float adj = (cfg.temp_baseline - mean_temp) / span;
    return std::max(0.0f, std::min(1.0f, adj));
}

daytemps_t FetchDayTemperatures(const sindex_cfg_s &cfg, const tempfetch_t &fetch)
{
    if (cfg.temp_weight <= 0 || not fetch)
        return daytemps_t();
    std::vector<int> offsets;
    for (int offset = 1; offset <= std::max(2, cfg.horizon_days); offset++)
        offsets.push_back(offset);
    return fetch(offsets);
}

loadmargin_s CalcLoadMargin(const slotseries_t &series, const sindex_cfg_s &cfg, const dailyforecast_s &daily,
                            int today, const daytemps_t &temps)
{
    loadmargin_s lm;
    lm.factor = OptNone();
    lm.avg_deficit = 0;
    lm.temp_adjustment = OptNone();
    lm.uncertainty = 0;
    std::map<int, daysum_s> sums = DaySums(series);

    float total = 0;
    for (int offset = 1; offset <= cfg.horizon_days; offset++)
    {
        int day = today + offset;
        float load, pv;
        std::map<int, daysum_s>::const_iterator it = sums.find(day);
        if (it != sums.end())
        {
            load = it->second.load;
            pv = it->second.pv;
        }
        else
        {
            // Horizont reicht nicht bis zu diesem Tag: Tagesprognose verwenden
            load = MapValue(daily.load, day);
            pv = MapValue(daily.pv, day);
            if (load <= 0 && pv <= 0)
                continue;
        }
        float deficit = 0;
        if (load > 0)
            deficit = std::max(0.0f, (load - pv) / std::max(load, 1e-6f));
        lm.considered_days.push_back(offset);
        lm.day_deficits[offset] = deficit;
        total += deficit;
    }
    if (lm.considered_days.size() == 0)
    {
        WriteLog(LOGDEBUG, "S-Index: keine verwertbaren Tage");
        return lm;
    }
    lm.avg_deficit = total / lm.considered_days.size();

    float temp_adj = 0;
    if (cfg.temp_weight > 0)
    {
        float sum = 0;
        int n = 0;
        for (size_t j = 0; j < lm.considered_days.size(); j++)
        {
            daytemps_t::const_iterator t = temps.find(lm.considered_days[j]);
            if (t != temps.end())
            {
                lm.temperatures[t->first] = t->second;
                sum += t->second;
                n++;
            }
        }
        if (n > 0)
        {
            temp_adj = TempAdjustment(sum / n, cfg);
            lm.temp_adjustment = OptVal(temp_adj);
        }
        else
            WriteLog(LOGWARN, "S-Index: keine Temperaturprognose, ohne Temperaturzuschlag");
    }
    float raw = cfg.base_factor + cfg.pv_deficit_weight * lm.avg_deficit + cfg.temp_weight * temp_adj;
    lm.factor = OptVal(std::min(cfg.max_factor, std::max(0.0f, raw)));
    WriteLog(LOGDEBUG, "S-Index dynamisch: %i Tage, Defizit %.3f, Temperatur %.3f, Faktor %.3f",
             (int)lm.considered_days.size(), lm.avg_deficit, temp_adj, lm.factor.val);
    return lm;
}

loadmargin_s CalcProbabilisticMargin(const slotseries_t &series, const sindex_cfg_s &cfg,
                                     const dailyforecast_s &daily, int today)
{
    loadmargin_s lm;
    lm.factor = OptNone();
    lm.avg_deficit = 0;
    lm.temp_adjustment = OptNone();
    lm.uncertainty = 0;
    std::map<int, daysum_s> sums = DaySums(series);

    float sigma = cfg.sigma[cfg.risk_appetite - 1];
    float load_p50 = 0;
    for (int offset = 1; offset <= cfg.horizon_days; offset++)
    {
        int day = today + offset;
        float l50, l90, p50, p10;
        std::map<int, daysum_s>::const_iterator it = sums.find(day);
        if (it != sums.end() && it->second.bands)
        {
            l50 = it->second.load;
            l90 = it->second.load_p90;
            p50 = it->second.pv;
            p10 = it->second.pv_p10;
        }
        else if (daily.load_p90.count(day) > 0)
        {
            l50 = MapValue(daily.load_p50, day);
            l90 = MapValue(daily.load_p90, day);
            p50 = MapValue(daily.pv_p50, day);
            p10 = MapValue(daily.pv_p10, day);
        }
        else
            continue;
        lm.considered_days.push_back(offset);
        lm.uncertainty += std::max(0.0f, l90 - l50) + std::max(0.0f, p50 - p10);
        load_p50 += l50;
    }
    if (lm.considered_days.size() == 0 || load_p50 <= 0)
    {
        WriteLog(LOGDEBUG, "S-Index probabilistisch: keine Bänder oder Last 0");
        return lm;
    }
    float target = std::max(load_p50 * 0.5f, load_p50 + lm.uncertainty * sigma);
    lm.factor = OptVal(std::min(cfg.max_factor, target / load_p50));
    WriteLog(LOGDEBUG, "S-Index probabilistisch: Last %.2f kWh, Unsicherheit %.2f kWh, Sigma %.2f, Faktor %.3f",
             load_p50, lm.uncertainty, sigma, lm.factor.val);
    return lm;
}

void CalcRiskFactor(const slotseries_t &series, const sindex_cfg_s &cfg, int today, const daytemps_t &temps,
                    optval_s cloud_volatility, optval_s temp_volatility, riskfactors_s &rf)
{
    std::map<int, daysum_s> sums = DaySums(series);
    const float weight[2] = {0.7, 0.3};
    float ratio[2] = {0, 0};
    rf.weighted_ratio = 0;
    for (int k = 0; k < 2; k++)
    {
        std::map<int, daysum_s>::const_iterator it = sums.find(today + k + 1);
        if (it == sums.end() || it->second.load <= 0)
            continue;
        // Überschuss ergibt ein negatives Verhältnis
        ratio[k] = (it->second.load - it->second.pv) / it->second.load;
        ratio[k] = std::max(-1.0f, std::min(1.0f, ratio[k]));
        rf.weighted_ratio += weight[k] * ratio[k];
    }
    rf.d1_ratio = ratio[0];
    rf.d2_ratio = ratio[1];

    float temp_adj = 0;
    rf.d2_temperature = OptNone();
    if (cfg.temp_weight > 0)
    {
        daytemps_t::const_iterator t = temps.find(2);
        if (t != temps.end())
        {
            rf.d2_temperature = OptVal(t->second);
            temp_adj = TempAdjustment(t->second, cfg);
        }
    }
    rf.pv_contribution = cfg.pv_deficit_weight * rf.weighted_ratio;
    rf.temp_contribution = cfg.temp_weight * temp_adj;
    rf.raw_factor = cfg.base_factor + rf.pv_contribution + rf.temp_contribution;

    // Wettervolatilität vergrößert den Puffer über 1.0
    rf.weather_volatility = std::max(OptOr(cloud_volatility, 0), OptOr(temp_volatility, 0));
    float amplification = 1 + rf.weather_volatility * cfg.weather_amplification;
    rf.raw_factor_weather = 1 + (rf.raw_factor - 1) * amplification;

    rf.multiplier = cfg.buffer_multiplier[cfg.risk_appetite - 1];
    float adjusted = 1 + rf.multiplier * (rf.raw_factor_weather - 1);
    rf.risk_factor = std::min(cfg.max_factor, std::max(cfg.min_factor, adjusted));
    WriteLog(LOGDEBUG, "Risikofaktor: D1 %.3f D2 %.3f roh %.3f Wetter %.3f Stufe %i -> %.3f",
             rf.d1_ratio, rf.d2_ratio, rf.raw_factor, rf.raw_factor_weather, cfg.risk_appetite, rf.risk_factor);
}

float CalcTargetSoc(float raw_factor, float min_soc_percent, float capacity_kwh, const sindex_cfg_s &cfg,
                    float &target_kwh, float &base_buffer, float &weather_adj)
{
    base_buffer = cfg.base_buffer[cfg.risk_appetite - 1];
    weather_adj = (raw_factor - 1) * cfg.weather_scale;
    weather_adj = std::max(-cfg.weather_cap, std::min(cfg.weather_cap, weather_adj));
    float pct = min_soc_percent + base_buffer + weather_adj;
    pct = std::max(cfg.target_floor, std::min(100.0f, pct));
    target_kwh = capacity_kwh > 0 ? pct / 100 * capacity_kwh : 0;
    return pct;
}
