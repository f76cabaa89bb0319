//
//  soctarget.cpp
//  planner
//

#include "soctarget.hpp"
#include "plannerlog.hpp"
#include <algorithm>
#include <cmath>

float CalcTerminalValue(const slotseries_t &series, size_t first, float risk_factor)
{
    float sum = 0;
    int n = 0;
    for (size_t j = first; j < series.size(); j++)
    {
        sum += series[j].import_price;
        n++;
    }
    if (n == 0)
        return 0;
    return sum / n * risk_factor;
}

std::vector<std::vector<int> > GroupBlocks(const std::vector<int> &indices, int max_gap)
{
    std::vector<std::vector<int> > blocks;
    for (size_t k = 0; k < indices.size(); k++)
    {
        if (blocks.size() > 0 && indices[k] <= blocks.back().back() + max_gap + 1)
            blocks.back().push_back(indices[k]);
        else
            blocks.push_back(std::vector<int>(1, indices[k]));
    }
    return blocks;
}

static float Clamp(float v, float lo, float hi)
{
    return std::max(lo, std::min(hi, v));
}

void ApplySocTargets(slotseries_t &series, const planner_config_t &cfg, size_t now_index)
{
    if (series.size() == 0)
        return;
    float min_soc = cfg.battery.min_soc_percent;
    float max_soc = cfg.battery.max_soc_percent;
    float guard = min_soc;
    float manual_charge = Clamp(OptOr(cfg.charging.manual_charge_target, max_soc), min_soc, max_soc);
    float manual_export = Clamp(OptOr(cfg.charging.manual_export_target, guard), min_soc, max_soc);
    size_t n = series.size();
    size_t start = std::min(now_index, n);

    std::vector<float> target(n, min_soc);

    // Vergangenheit: aufgezeichneter SoC bleibt stehen
    for (size_t j = 0; j < start; j++)
        if (series[j].entry_soc.set)
            target[j] = series[j].entry_soc.val;

    for (size_t j = start; j < n; j++)
    {
        const slot_s &s = series[j];
        if (s.action == ACT_HOLD && s.entry_soc.set)
            target[j] = s.entry_soc.val;
        else if (s.action == ACT_EXPORT)
            target[j] = s.manual == MAN_EXPORT ? manual_export : guard;
        else if (s.action == ACT_DISCHARGE)
            target[j] = min_soc;
    }

    // Ladeblöcke: ein Sollwert je Block, SoC am Blockende
    std::vector<int> charge;
    for (size_t j = start; j < n; j++)
        if (series[j].action == ACT_CHARGE)
            charge.push_back(j);
    std::vector<std::vector<int> > blocks = GroupBlocks(charge, 1);
    for (size_t b = 0; b < blocks.size(); b++)
    {
        int first = blocks[b].front();
        int last = blocks[b].back();
        float value = Clamp(series[last].soc_percent, min_soc, max_soc);
        for (size_t k = 0; k < blocks[b].size(); k++)
            if (series[blocks[b][k]].manual == MAN_CHARGE)
            {
                value = std::min(value, manual_charge);
                break;
            }
        for (int j = first; j <= last; j++)
            target[j] = value;
    }

    // Einspeiseblöcke
    for (size_t j = start; j < n; j++)
    {
        if (series[j].action != ACT_EXPORT)
            continue;
        size_t first = j;
        bool manual = series[j].manual == MAN_EXPORT;
        while (j + 1 < n && series[j + 1].action == ACT_EXPORT)
        {
            j++;
            if (series[j].manual == MAN_EXPORT)
                manual = true;
        }
        float value = manual ? manual_export : std::max(guard, series[j].soc_percent);
        for (size_t k = first; k <= j; k++)
            target[k] = value;
    }

    // Warmwasser: aus der Batterie -> min_soc, nur Netz -> SoC halten
    for (size_t j = start; j < n; j++)
    {
        if (series[j].water_kw <= 0)
            continue;
        size_t first = j;
        bool batt = series[j].water_batt_kwh > 0;
        bool grid = series[j].water_grid_kwh > 0;
        while (j + 1 < n && series[j + 1].water_kw > 0)
        {
            j++;
            batt = batt || series[j].water_batt_kwh > 0;
            grid = grid || series[j].water_grid_kwh > 0;
        }
        float entry = OptOr(series[first].entry_soc, target[first]);
        for (size_t k = first; k <= j; k++)
        {
            // Lade- und Einspeiseblöcke behalten ihren Sollwert
            if (series[k].action == ACT_CHARGE || series[k].action == ACT_EXPORT)
                continue;
            if (batt)
                target[k] = min_soc;
            else if (grid)
                target[k] = std::max(target[k], entry);
        }
    }

    for (size_t j = 0; j < n; j++)
        if (series[j].action == ACT_HOLD && series[j].entry_soc.set)
            target[j] = series[j].entry_soc.val;

    for (size_t j = 0; j < n; j++)
        series[j].soc_target = roundf(target[j] * 100) / 100;
    WriteLog(LOGDEBUG, "Ziel-SoC: %i Ladeblöcke ab Slot %i", (int)blocks.size(), (int)start);
}
