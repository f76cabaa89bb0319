//
//  greedysolver.cpp
//  planner
//

#include "greedysolver.hpp"
#include "windows.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>

GreedySolver::GreedySolver(float low_percentile)
{
    this->low_percentile = low_percentile;
}

// Bedarf in Hochpreisslots bis zum nächsten Niedrigpreis, abzüglich PV-Zugewinn
float GreedySolver::NeedAhead(const solverinput_s &in, size_t j, float low, float high, float eff_c, float eff_d) const
{
    float need = 0;     // kWh im Speicher
    float gain = 0;     // solarer Zugewinn
    for (size_t k = j + 1; k < in.slots.size(); k++)
    {
        const solverslot_s &s = in.slots[k];
        if (s.import_price <= low)
            break;      // dort kann wieder nachgeladen werden
        float net = s.load_kwh - s.pv_kwh;
        if (net > 0 && s.import_price >= high)
        {
            if (gain > net)
                gain = gain - net;
            else
            {
                need = need + (net - gain) / eff_d;
                gain = 0;
            }
        }
        else if (net < 0)
            gain = gain - net * eff_c;
    }
    return need;
}

bool GreedySolver::Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err)
{
    out.slots.clear();
    out.total_cost = 0;
    if (in.slots.size() == 0)
        return true;
    if (cfg.capacity_kwh < 0 || cfg.max_charge_kw < 0 || cfg.max_discharge_kw < 0)
    {
        err = "invalid battery limits";
        return false;
    }

    float min_kwh = cfg.capacity_kwh * cfg.min_soc_percent / 100;
    float max_kwh = cfg.capacity_kwh * cfg.max_soc_percent / 100;
    float eff_c = cfg.charge_eff > 0 ? cfg.charge_eff : 1;
    float eff_d = cfg.discharge_eff > 0 ? cfg.discharge_eff : 1;
    float target = std::min(cfg.target_soc_kwh, max_kwh);

    std::vector<float> prices;
    for (size_t j = 0; j < in.slots.size(); j++)
        prices.push_back(in.slots[j].import_price);
    float low = Percentile(prices, low_percentile);
    float high = low / (eff_c * eff_d) + cfg.cycle_cost;   // Gewinnschwelle

    float soc = std::max(0.0f, std::min(cfg.capacity_kwh, in.initial_soc_kwh));
    for (size_t j = 0; j < in.slots.size(); j++)
    {
        if (Cancelled())
        {
            err = "cancelled";
            return false;
        }
        const solverslot_s &s = in.slots[j];
        float h = (s.end - s.start) / 3600.0;
        if (h <= 0)
            h = SLOTHOURS;
        float maxc = cfg.max_charge_kw * h;
        float maxd = cfg.max_discharge_kw * h;
        float charge = 0, discharge = 0, imp = 0, ex = 0;
        float net = s.load_kwh - s.pv_kwh;

        if (net < 0)
        {
            // PV-Überschuss in den Speicher, Rest einspeisen
            float surplus = -net;
            float c = std::min(std::min(surplus, maxc), std::max(0.0f, (max_kwh - soc) / eff_c));
            charge += c;
            soc += c * eff_c;
            surplus -= c;
            if (cfg.enable_export)
                ex += surplus;
        }
        else
        {
            if (s.import_price >= high && soc > min_kwh)
            {
                float d = std::min(std::min(net, maxd), (soc - min_kwh) * eff_d);
                discharge += d;
                soc -= d / eff_d;
                net -= d;
            }
            imp += net;
        }

        float need = min_kwh + NeedAhead(in, j, low, high, eff_c, eff_d);
        if (s.import_price <= low && discharge <= 0)
        {
            // Netzladen bis Bedarf bzw. Ziel-SoC
            float goal = std::min(max_kwh, std::max(need, target));
            if (soc < goal)
            {
                float c = std::min(maxc - charge, (goal - soc) / eff_c);
                if (c > 0)
                {
                    charge += c;
                    soc += c * eff_c;
                    imp += c;
                }
            }
        }
        else if (cfg.enable_export && charge <= 0 && s.export_price - cfg.export_threshold >= high
                 && s.export_price > cfg.terminal_value)
        {
            float keep = std::max(std::max(min_kwh, target), need);
            float d = std::min(maxd - discharge, std::max(0.0f, (soc - keep) * eff_d));
            if (d > 0.001)
            {
                discharge += d;
                soc -= d / eff_d;
                ex += d;
            }
        }

        solverslotresult_s r;
        r.start = s.start;
        r.charge_kw = charge / h;
        r.discharge_kw = discharge / h;
        r.import_kwh = imp;
        r.export_kwh = ex;
        r.soc_kwh = soc;
        r.action = ClassifyAction(r.charge_kw, r.discharge_kw, ex);
        r.cost = imp * s.import_price - ex * s.export_price + (charge + discharge) * cfg.cycle_cost;
        out.total_cost += r.cost;
        out.slots.push_back(r);
    }
    // Restwert des Speichers am Horizontende
    out.total_cost -= soc * cfg.terminal_value;
    if (target > 0 && soc < target)
        out.total_cost += (target - soc) * cfg.target_penalty;
    WriteLog(LOGDEBUG, "greedy: Schwellen %.4f/%.4f, End-SoC %.2f kWh, Kosten %.2f", low, high, soc, out.total_cost);
    return true;
}
