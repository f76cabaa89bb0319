//
//  dataprep.cpp
//  planner
//

#include "dataprep.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>
#include <map>

slot_s NewSlot(time_t hh, time_t end)
{
    slot_s s = slot_s();
    s.hh = hh;
    s.end = end;
    s.pv_p10 = OptNone();
    s.pv_p90 = OptNone();
    s.load_p10 = OptNone();
    s.load_p90 = OptNone();
    s.entry_soc = OptNone();
    s.manual = MAN_NONE;
    s.action = ACT_HOLD;
    return s;
}

void PrepareSlots(const snapshot_s &snap, slotseries_t &series)
{
    series.clear();
    if (snap.prices.size() == 0)
    {
        WriteLog(LOGWARN, "keine Preisdaten, leere Slotreihe");
        return;
    }

    // doppelte Zeitstempel: letzter Eintrag gewinnt
    std::map<time_t, pricerec_s> prices;
    int dropped = 0;
    for (size_t j = 0; j < snap.prices.size(); j++)
    {
        const pricerec_s &p = snap.prices[j];
        if (not p.import_price.set)
        {
            dropped++;
            continue;
        }
        if (prices.count(p.start) > 0)
            WriteLog(LOGWARN, "price_data: doppelter Slot %s, letzter Wert gilt", FormatTimestamp(p.start).c_str());
        prices[p.start] = p;
    }
    if (dropped > 0)
        WriteLog(LOGWARN, "price_data: %i Einträge ohne Importpreis verworfen", dropped);

    std::map<time_t, forecastrec_s> forecasts;
    for (size_t j = 0; j < snap.forecasts.size(); j++)
    {
        const forecastrec_s &f = snap.forecasts[j];
        if (forecasts.count(f.start) > 0)
            WriteLog(LOGWARN, "forecast_data: doppelter Slot %s, letzter Wert gilt", FormatTimestamp(f.start).c_str());
        forecasts[f.start] = f;
    }

    int exportdefault = 0;
    int missing = 0;
    float lastload = 0;
    bool haveload = false;
    for (std::map<time_t, pricerec_s>::const_iterator it = prices.begin(); it != prices.end(); ++it)
    {
        const pricerec_s &p = it->second;
        time_t end = (p.end > p.start) ? p.end : p.start + SLOTSECONDS;
        slot_s s = NewSlot(p.start, end);
        s.import_price = p.import_price.val;
        if (p.export_price.set)
            s.export_price = p.export_price.val;
        else
        {
            // Einspeisepreis fehlt: Importpreis verwenden
            s.export_price = p.import_price.val;
            exportdefault++;
        }

        std::map<time_t, forecastrec_s>::const_iterator f = forecasts.find(p.start);
        if (f != forecasts.end())
        {
            s.pv = OptOr(f->second.pv, 0);
            if (f->second.load.set)
            {
                lastload = f->second.load.val;
                haveload = true;
            }
            s.pv_p10 = f->second.pv_p10;
            s.pv_p90 = f->second.pv_p90;
            s.load_p10 = f->second.load_p10;
            s.load_p90 = f->second.load_p90;
        }
        else
            missing++;
        s.load = haveload ? lastload : 0;
        series.push_back(s);
    }
    if (exportdefault > 0)
        WriteLog(LOGDEBUG, "%i Slots ohne Einspeisepreis, Importpreis übernommen", exportdefault);
    if (missing > 0)
        WriteLog(LOGWARN, "%i Slots ohne Prognose, PV=0 und Last fortgeschrieben", missing);

    for (size_t j = 1; j < series.size(); j++)
    {
        if (series[j].hh - series[j - 1].hh != SLOTSECONDS)
            WriteLog(LOGWARN, "Lücke in der Slotreihe zwischen %s und %s",
                     FormatTimestamp(series[j - 1].hh).c_str(), FormatTimestamp(series[j].hh).c_str());
    }
}

void DisableSolar(slotseries_t &series)
{
    for (size_t j = 0; j < series.size(); j++)
    {
        series[j].pv = 0;
        series[j].adj_pv = 0;
        series[j].pv_p10 = OptNone();
        series[j].pv_p90 = OptNone();
    }
}

void ApplySafetyMargins(slotseries_t &series, const planner_config_t &cfg, const learning_s &overlay, float load_margin)
{
    float pv_conf = cfg.charging.pv_confidence / 100.0;
    bool pv_adj = cfg.learning && overlay.pv_adj.size() == 24;
    bool load_adj = cfg.learning && overlay.load_adj.size() == 24;
    for (size_t j = 0; j < series.size(); j++)
    {
        slot_s &s = series[j];
        s.adj_pv = cfg.sys.has_solar ? s.pv * pv_conf : 0;
        s.adj_load = s.load * load_margin;
        if (pv_adj || load_adj)
        {
            int hour = LocalHour(s.hh);
            if (pv_adj && cfg.sys.has_solar)
                s.adj_pv = std::max(0.0f, s.adj_pv + overlay.pv_adj[hour]);
            if (load_adj)
                s.adj_load = std::max(0.0f, s.adj_load + overlay.load_adj[hour]);
        }
    }
    WriteLog(LOGDEBUG, "Sicherheitszuschlag: PV %.0f%%, Last x%.3f%s", cfg.charging.pv_confidence, load_margin,
             (pv_adj || load_adj) ? ", Lernkorrektur aktiv" : "");
}

void MarkHistory(slotseries_t &series, const std::vector<historyrec_s> &history, time_t now)
{
    std::map<time_t, float> soc;
    for (size_t j = 0; j < history.size(); j++)
        if (history[j].soc_percent.set)
            soc[history[j].start] = history[j].soc_percent.val;
    for (size_t j = 0; j < series.size(); j++)
    {
        slot_s &s = series[j];
        s.historical = s.hh < now;
        if (not s.historical)
            continue;
        std::map<time_t, float>::const_iterator it = soc.find(s.hh);
        if (it != soc.end())
        {
            s.entry_soc = OptVal(it->second);
            s.soc_percent = it->second;
        }
    }
}
