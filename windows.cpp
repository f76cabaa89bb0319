//
//  windows.cpp
//  planner
//

#include "windows.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>
#include <math.h>

float Percentile(std::vector<float> values, float pct)
{
    if (values.size() == 0)
        return 0;
    std::sort(values.begin(), values.end());
    float pos = pct / 100 * (values.size() - 1);
    if (pos <= 0)
        return values.front();
    if (pos >= values.size() - 1)
        return values.back();
    size_t lo = (size_t)floor(pos);
    float frac = pos - lo;
    return values[lo] + (values[lo + 1] - values[lo]) * frac;
}

windowresult_s IdentifyWindows(slotseries_t &series, const planner_config_t &cfg, float current_kwh, time_t now)
{
    windowresult_s wr = windowresult_s();
    std::vector<float> prices;
    for (size_t j = 0; j < series.size(); j++)
        prices.push_back(series[j].import_price);
    if (prices.size() == 0)
        return wr;

    wr.percentile_price = Percentile(prices, cfg.charging.percentile);
    float maxcheap = wr.percentile_price;
    bool found = false;
    for (size_t j = 0; j < prices.size(); j++)
    {
        if (prices[j] <= wr.percentile_price && (not found || prices[j] > maxcheap))
        {
            maxcheap = prices[j];
            found = true;
        }
    }
    wr.baseline = maxcheap + cfg.charging.tolerance + cfg.charging.smoothing;
    wr.threshold = wr.baseline;

    // Ladeziel: manuell, strategisch, sonst max SoC
    if (cfg.charging.manual_charge_target.set)
        wr.target_percent = cfg.charging.manual_charge_target.val;
    else
        wr.target_percent = OptOr(cfg.charging.strategic_target, cfg.battery.max_soc_percent);
    float capacity = cfg.sys.has_battery ? cfg.battery.capacity_kwh : 0;
    wr.deficit_kwh = std::max(0.0f, wr.target_percent / 100 * capacity - current_kwh);

    float slot_kwh = cfg.battery.max_charge_kw * SLOTHOURS;
    std::vector<float> future;
    int cheapslots = 0;
    for (size_t j = 0; j < series.size(); j++)
    {
        if (series[j].hh < now)
            continue;
        future.push_back(series[j].import_price);
        if (series[j].import_price <= wr.baseline)
            cheapslots++;
    }
    wr.capacity_kwh = cheapslots * slot_kwh;

    if (wr.deficit_kwh > wr.capacity_kwh && slot_kwh > 0)
    {
        wr.needed_slots = (int)ceil(wr.deficit_kwh / slot_kwh);
        if (future.size() > 0 && wr.needed_slots > 0)
        {
            std::sort(future.begin(), future.end());
            size_t idx = std::min(future.size() - 1, (size_t)wr.needed_slots - 1);
            wr.threshold = std::max(wr.baseline, future[idx] + (float)EXPANSIONSTEP);
            wr.expanded = true;
            WriteLog(LOGINFO, "Ladefenster erweitert: Defizit %.2f kWh > %.2f kWh, Schwelle %.4f -> %.4f",
                     wr.deficit_kwh, wr.capacity_kwh, wr.baseline, wr.threshold);
        }
        else
            WriteLog(LOGDEBUG, "Ladefenster: keine zukünftigen Preise, keine Erweiterung");
    }

    for (size_t j = 0; j < series.size(); j++)
    {
        series[j].cheap = series[j].import_price <= wr.threshold;
        if (series[j].cheap)
        {
            wr.cheap_total++;
            if (series[j].hh >= now)
                wr.cheap_future++;
        }
    }
    WriteLog(LOGDEBUG, "Ladefenster: Perzentil %.4f Basis %.4f Schwelle %.4f, %i von %i Slots günstig",
             wr.percentile_price, wr.baseline, wr.threshold, wr.cheap_total, (int)series.size());
    return wr;
}
