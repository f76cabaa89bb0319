//
//  manualplan.cpp
//  planner
//

#include "manualplan.hpp"
#include "solver.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include <string.h>
#include <ctype.h>

const char *ManualName(int manual)
{
    switch (manual)
    {
        case MAN_CHARGE: return "Charge";
        case MAN_WATER: return "Water Heating";
        case MAN_EXPORT: return "Export";
        case MAN_HOLD: return "Hold";
        default: return "";
    }
}

static std::string Lower(const std::string &s)
{
    std::string l = s;
    for (size_t j = 0; j < l.size(); j++)
        l[j] = tolower((unsigned char)l[j]);
    return l;
}

static std::string Trim(const std::string &s)
{
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos)
        return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

int InferManualAction(const manualentry_s &entry)
{
    std::string action = Lower(Trim(entry.action));
    if (action.size() > 0)
    {
        if (action == "charge")
            return MAN_CHARGE;
        if (action == "water heating" || action == "water")
            return MAN_WATER;
        if (action == "export")
            return MAN_EXPORT;
        if (action == "hold")
            return MAN_HOLD;
        return MAN_NONE;
    }
    std::string id = Lower(entry.id);
    if (id.find("charge") != std::string::npos)
        return MAN_CHARGE;
    if (id.find("water") != std::string::npos)
        return MAN_WATER;
    if (id.find("export") != std::string::npos)
        return MAN_EXPORT;
    if (id.find("hold") != std::string::npos)
        return MAN_HOLD;

    std::string group = Lower(entry.group);
    if (group == "battery")
        return MAN_CHARGE;
    if (group == "water")
        return MAN_WATER;
    if (group == "export")
        return MAN_EXPORT;
    if (group == "hold")
        return MAN_HOLD;
    return MAN_NONE;
}

int ApplyManualPlan(slotseries_t &series, const std::vector<manualentry_s> &plan, const planner_config_t &cfg,
                    time_t now)
{
    int applied = 0;
    float charge_kw = cfg.sys.has_battery ? cfg.battery.max_charge_kw : 0;
    for (size_t k = 0; k < plan.size(); k++)
    {
        const manualentry_s &e = plan[k];
        // Hintergrund und Platzhalter der Zeitleiste
        if (Lower(e.type) == "background" || e.id.compare(0, 12, "lane-spacer-") == 0
            || Lower(e.classname).find("lane-spacer") != std::string::npos)
            continue;
        int action = InferManualAction(e);
        if (action == MAN_NONE)
        {
            WriteLog(LOGDEBUG, "manueller Eintrag %s: Aktion '%s' unbekannt", e.id.c_str(), e.action.c_str());
            continue;
        }
        if (action == MAN_WATER && not WaterEnabled(cfg))
        {
            WriteLog(LOGWARN, "manueller Eintrag %s: kein Warmwasserbereiter konfiguriert", e.id.c_str());
            continue;
        }
        int n = 0;
        for (size_t j = 0; j < series.size(); j++)
        {
            slot_s &s = series[j];
            if (s.hh < e.start || s.hh >= e.end || s.hh < now)
                continue;
            s.manual = action;
            if (action == MAN_CHARGE)
            {
                s.charge_kw = charge_kw;
                if (charge_kw > 0.01)
                    s.action = ACT_CHARGE;
            }
            else if (action == MAN_WATER)
            {
                s.water_kw = cfg.water.power_kw;
                SplitWater(s);
            }
            n++;
        }
        if (n > 0)
            WriteLog(LOGINFO, "manuell %s: %s bis %s, %i Slots", ManualName(action),
                     FormatTimestamp(e.start).c_str(), FormatTimestamp(e.end).c_str(), n);
        applied += n;
    }
    return applied;
}
