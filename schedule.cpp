//
//  schedule.cpp
//  planner
//

#include "schedule.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <stdio.h>
#include <stdlib.h>
#include <math.h>

static double R2(float v)
{
    return round(v * 100.0) / 100.0;
}

static void AddOpt(cJSON *obj, const char *name, const optval_s &o)
{
    if (o.set)
        cJSON_AddNumberToObject(obj, name, R2(o.val));
    else
        cJSON_AddNullToObject(obj, name);
}

const char *SlotReason(const slot_s &s, const char *&priority)
{
    if (s.export_kwh > 0)
    {
        priority = "medium";
        return "profitable_export";
    }
    if (s.discharge_kw > 0)
    {
        priority = "high";
        return "expensive_grid_power";
    }
    if (s.charge_kw > 0)
    {
        priority = "high";
        return s.import_kwh > 0 ? "cheap_grid_power" : "excess_pv";
    }
    if (s.water_kw > 0)
    {
        priority = "medium";
        return "water_heating";
    }
    priority = "low";
    return "no_action_needed";
}

float PlannedCost(const slot_s &s)
{
    return s.import_kwh * s.import_price - s.export_kwh * s.export_price;
}

cJSON *SlotToJson(const slot_s &s, int slot_number)
{
    cJSON *item = cJSON_CreateObject();
    cJSON_AddNumberToObject(item, "slot_number", slot_number);
    cJSON_AddStringToObject(item, "start_time", FormatTimestamp(s.hh).c_str());
    cJSON_AddStringToObject(item, "end_time", FormatTimestamp(s.end).c_str());
    cJSON_AddNumberToObject(item, "import_price_sek_kwh", R2(s.import_price));
    cJSON_AddNumberToObject(item, "export_price_sek_kwh", R2(s.export_price));
    cJSON_AddNumberToObject(item, "pv_forecast_kwh", R2(s.pv));
    cJSON_AddNumberToObject(item, "load_forecast_kwh", R2(s.load));
    cJSON_AddNumberToObject(item, "adjusted_pv_kwh", R2(s.adj_pv));
    cJSON_AddNumberToObject(item, "adjusted_load_kwh", R2(s.adj_load));
    cJSON_AddBoolToObject(item, "is_cheap", s.cheap);
    cJSON_AddNumberToObject(item, "water_heating_kw", R2(s.water_kw));
    cJSON_AddNumberToObject(item, "battery_charge_kw", R2(s.charge_kw));
    cJSON_AddNumberToObject(item, "battery_discharge_kw", R2(s.discharge_kw));
    cJSON_AddNumberToObject(item, "import_kwh", R2(s.import_kwh));
    cJSON_AddNumberToObject(item, "export_kwh", R2(s.export_kwh));
    cJSON_AddNumberToObject(item, "projected_soc_kwh", R2(s.soc_kwh));
    cJSON_AddNumberToObject(item, "projected_soc_percent", R2(s.soc_percent));
    AddOpt(item, "entry_soc_percent", s.entry_soc);
    cJSON_AddNumberToObject(item, "soc_target_percent", R2(s.soc_target));
    cJSON_AddStringToObject(item, "action", ActionName(s.action));
    if (s.manual != MAN_NONE)
        cJSON_AddStringToObject(item, "manual_action", ManualName(s.manual));
    else
        cJSON_AddNullToObject(item, "manual_action");
    cJSON_AddNumberToObject(item, "water_from_pv_kwh", R2(s.water_pv_kwh));
    cJSON_AddNumberToObject(item, "water_from_battery_kwh", R2(s.water_batt_kwh));
    cJSON_AddNumberToObject(item, "water_from_grid_kwh", R2(s.water_grid_kwh));
    const char *priority;
    const char *reason = SlotReason(s, priority);
    cJSON_AddStringToObject(item, "reason", reason);
    cJSON_AddStringToObject(item, "priority", priority);
    cJSON_AddNumberToObject(item, "planned_cost_sek", R2(PlannedCost(s)));
    cJSON_AddBoolToObject(item, "is_historical", s.historical);
    return item;
}

static cJSON *SIndexToJson(const planresult_s &res)
{
    const riskfactors_s &rf = res.risk;
    const sindex_cfg_s &sc = res.cfg.sindex;
    cJSON *obj = cJSON_CreateObject();
    const char *mode = rf.mode == SINDEX_STATIC ? "static" : rf.mode == SINDEX_PROBABILISTIC ? "probabilistic" : "dynamic";
    cJSON_AddStringToObject(obj, "mode", mode);
    cJSON_AddNumberToObject(obj, "base_factor", R2(sc.base_factor));
    cJSON_AddNumberToObject(obj, "max_factor", R2(sc.max_factor));
    cJSON_AddNumberToObject(obj, "effective_load_margin", rf.effective_load_margin);
    cJSON_AddBoolToObject(obj, "fallback_to_base_factor", not rf.margin.factor.set);
    cJSON_AddNumberToObject(obj, "avg_deficit", rf.margin.avg_deficit);
    AddOpt(obj, "temperature_adjustment", rf.margin.temp_adjustment);
    if (rf.mode == SINDEX_PROBABILISTIC)
        cJSON_AddNumberToObject(obj, "uncertainty_kwh", R2(rf.margin.uncertainty));

    cJSON *days = cJSON_CreateArray();
    for (size_t k = 0; k < rf.margin.considered_days.size(); k++)
        cJSON_AddItemToArray(days, cJSON_CreateNumber(rf.margin.considered_days[k]));
    cJSON_AddItemToObject(obj, "considered_days", days);

    cJSON *deficits = cJSON_CreateObject();
    for (std::map<int, float>::const_iterator it = rf.margin.day_deficits.begin(); it != rf.margin.day_deficits.end(); ++it)
    {
        char key[16];
        snprintf(key, sizeof(key), "%i", it->first);
        cJSON_AddNumberToObject(deficits, key, it->second);
    }
    cJSON_AddItemToObject(obj, "daily_deficits", deficits);

    cJSON *temps = cJSON_CreateObject();
    for (std::map<int, float>::const_iterator it = rf.margin.temperatures.begin(); it != rf.margin.temperatures.end(); ++it)
    {
        char key[16];
        snprintf(key, sizeof(key), "%i", it->first);
        cJSON_AddNumberToObject(temps, key, R2(it->second));
    }
    cJSON_AddItemToObject(obj, "temperatures", temps);

    cJSON *risk = cJSON_CreateObject();
    cJSON_AddNumberToObject(risk, "risk_appetite", sc.risk_appetite);
    cJSON_AddNumberToObject(risk, "d1_deficit_ratio", rf.d1_ratio);
    cJSON_AddNumberToObject(risk, "d2_deficit_ratio", rf.d2_ratio);
    cJSON_AddNumberToObject(risk, "weighted_ratio", rf.weighted_ratio);
    cJSON_AddNumberToObject(risk, "pv_contribution", rf.pv_contribution);
    cJSON_AddNumberToObject(risk, "temp_contribution", rf.temp_contribution);
    AddOpt(risk, "d2_temperature_c", rf.d2_temperature);
    cJSON_AddNumberToObject(risk, "raw_factor", rf.raw_factor);
    cJSON_AddNumberToObject(risk, "weather_volatility", rf.weather_volatility);
    cJSON_AddNumberToObject(risk, "raw_factor_with_weather", rf.raw_factor_weather);
    cJSON_AddNumberToObject(risk, "appetite_multiplier", rf.multiplier);
    cJSON_AddNumberToObject(risk, "risk_factor", rf.risk_factor);
    cJSON_AddItemToObject(obj, "risk", risk);
    return obj;
}

static cJSON *TargetSocToJson(const planresult_s &res)
{
    const riskfactors_s &rf = res.risk;
    cJSON *obj = cJSON_CreateObject();
    cJSON_AddNumberToObject(obj, "min_soc_percent", R2(res.cfg.battery.min_soc_percent));
    cJSON_AddNumberToObject(obj, "base_buffer_percent", R2(rf.target_base_buffer));
    cJSON_AddNumberToObject(obj, "weather_adjustment_percent", R2(rf.target_weather_adj));
    cJSON_AddNumberToObject(obj, "target_percent", R2(rf.target_percent));
    cJSON_AddNumberToObject(obj, "target_kwh", R2(rf.target_kwh));
    cJSON_AddNumberToObject(obj, "target_penalty", R2(res.target_penalty));
    cJSON_AddNumberToObject(obj, "terminal_value", res.terminal_value);
    return obj;
}

cJSON *ScheduleToJson(const planresult_s &res)
{
    // Zeitstempel in der Zeitzone des Laufs
    TimezoneScope tzscope(res.cfg.sys.timezone);
    cJSON *root = cJSON_CreateObject();
    cJSON *arr = cJSON_CreateArray();
    for (size_t j = 0; j < res.series.size(); j++)
        cJSON_AddItemToArray(arr, SlotToJson(res.series[j], j + 1));
    cJSON_AddItemToObject(root, "schedule", arr);

    cJSON *meta = cJSON_CreateObject();
    cJSON_AddStringToObject(meta, "planned_at", FormatTimestamp(res.now).c_str());
    cJSON_AddStringToObject(meta, "planner_version", VERSION);
    cJSON_AddStringToObject(meta, "solver", res.solver.c_str());
    cJSON_AddStringToObject(meta, "timezone", res.cfg.sys.timezone);
    cJSON_AddItemToObject(meta, "s_index", SIndexToJson(res));
    cJSON_AddItemToObject(meta, "target_soc", TargetSocToJson(res));
    cJSON_AddItemToObject(root, "meta", meta);
    return root;
}

static cJSON *WaterToJson(const planresult_s &res, float pv, float batt, float grid)
{
    const waterresult_s &wr = res.water;
    cJSON *obj = cJSON_CreateObject();
    cJSON_AddBoolToObject(obj, "enabled", wr.enabled);
    cJSON_AddBoolToObject(obj, "vacation_mode", wr.vacation);
    cJSON_AddNumberToObject(obj, "total_water_scheduled_kwh", R2(wr.total_kwh));
    cJSON_AddNumberToObject(obj, "total_water_slots", wr.total_slots);
    cJSON_AddNumberToObject(obj, "water_from_pv_kwh", R2(pv));
    cJSON_AddNumberToObject(obj, "water_from_battery_kwh", R2(batt));
    cJSON_AddNumberToObject(obj, "water_from_grid_kwh", R2(grid));
    cJSON *days = cJSON_CreateArray();
    for (size_t k = 0; k < wr.days.size(); k++)
    {
        const waterday_s &wd = wr.days[k];
        cJSON *d = cJSON_CreateObject();
        cJSON_AddStringToObject(d, "date", FormatDay(wd.day).c_str());
        cJSON_AddNumberToObject(d, "required_kwh", R2(wd.required_kwh));
        cJSON_AddNumberToObject(d, "consumed_kwh", R2(wd.consumed_kwh));
        cJSON_AddNumberToObject(d, "scheduled_kwh", R2(wd.scheduled_kwh));
        cJSON_AddNumberToObject(d, "slots_needed", wd.slots_needed);
        cJSON_AddNumberToObject(d, "slots_scheduled", wd.slots_scheduled);
        cJSON_AddNumberToObject(d, "blocks", wd.blocks);
        cJSON_AddBoolToObject(d, "deferred", wd.deferred);
        cJSON_AddNumberToObject(d, "deferred_slots", wd.deferred_slots);
        cJSON_AddBoolToObject(d, "anti_legionella", wd.anti_legionella);
        cJSON_AddItemToArray(days, d);
    }
    cJSON_AddItemToObject(obj, "days", days);
    return obj;
}

cJSON *DebugToJson(const planresult_s &res, int sample_size)
{
    TimezoneScope tzscope(res.cfg.sys.timezone);
    const windowresult_s &w = res.windows;
    float charge = 0, exported = 0, revenue = 0, pv = 0, load = 0;
    float water_pv = 0, water_batt = 0, water_grid = 0;
    for (size_t j = 0; j < res.series.size(); j++)
    {
        const slot_s &s = res.series[j];
        float h = (s.end - s.hh) / 3600.0;
        charge += s.charge_kw * h;
        exported += s.export_kwh;
        revenue += s.export_kwh * s.export_price;
        pv += s.adj_pv;
        load += s.adj_load;
        water_pv += s.water_pv_kwh;
        water_batt += s.water_batt_kwh;
        water_grid += s.water_grid_kwh;
    }

    cJSON *root = cJSON_CreateObject();
    cJSON *windows = cJSON_CreateObject();
    cJSON_AddNumberToObject(windows, "percentile_price_sek_kwh", w.percentile_price);
    cJSON_AddNumberToObject(windows, "baseline_threshold_sek_kwh", w.baseline);
    cJSON_AddNumberToObject(windows, "cheap_threshold_sek_kwh", w.threshold);
    cJSON_AddNumberToObject(windows, "smoothing_tolerance_sek_kwh", res.cfg.charging.tolerance + res.cfg.charging.smoothing);
    cJSON_AddBoolToObject(windows, "expanded", w.expanded);
    cJSON_AddNumberToObject(windows, "charge_target_percent", R2(w.target_percent));
    cJSON_AddNumberToObject(windows, "deficit_kwh", R2(w.deficit_kwh));
    cJSON_AddNumberToObject(windows, "cheap_capacity_kwh", R2(w.capacity_kwh));
    cJSON_AddNumberToObject(windows, "needed_slots", w.needed_slots);
    cJSON_AddNumberToObject(windows, "cheap_slot_count", w.cheap_total);
    cJSON_AddNumberToObject(windows, "cheap_future_slot_count", w.cheap_future);
    cJSON_AddNumberToObject(windows, "non_cheap_slot_count", (int)res.series.size() - w.cheap_total);
    cJSON_AddItemToObject(root, "windows", windows);

    cJSON_AddItemToObject(root, "water_analysis", WaterToJson(res, water_pv, water_batt, water_grid));

    cJSON *plan = cJSON_CreateObject();
    cJSON_AddNumberToObject(plan, "total_charge_kwh", R2(charge));
    cJSON_AddNumberToObject(plan, "total_export_kwh", R2(exported));
    cJSON_AddNumberToObject(plan, "total_export_revenue", R2(revenue));
    cJSON_AddNumberToObject(plan, "manual_slots", res.manual_slots);
    cJSON_AddItemToObject(root, "charging_plan", plan);

    cJSON *metrics = cJSON_CreateObject();
    cJSON_AddNumberToObject(metrics, "total_pv_generation_kwh", R2(pv));
    cJSON_AddNumberToObject(metrics, "total_load_kwh", R2(load));
    cJSON_AddNumberToObject(metrics, "net_energy_balance_kwh", R2(pv - load));
    cJSON_AddNumberToObject(metrics, "initial_soc_kwh", R2(res.initial_soc_kwh));
    cJSON_AddNumberToObject(metrics, "final_soc_percent", res.series.size() > 0 ? R2(res.series.back().soc_percent) : 0);
    cJSON_AddNumberToObject(metrics, "solver_cost", R2(res.solver_cost));
    cJSON_AddItemToObject(root, "metrics", metrics);

    cJSON_AddItemToObject(root, "s_index", SIndexToJson(res));
    cJSON_AddItemToObject(root, "target_soc", TargetSocToJson(res));

    cJSON *sample = cJSON_CreateArray();
    for (size_t j = res.now_index; j < res.series.size() && (int)(j - res.now_index) < sample_size; j++)
        cJSON_AddItemToArray(sample, SlotToJson(res.series[j], j + 1));
    cJSON_AddItemToObject(root, "sample_schedule", sample);
    return root;
}

bool WriteJsonFile(const char *fname, const cJSON *json, std::string &err)
{
    char *text = cJSON_Print(json);
    if (text == NULL)
    {
        err = std::string("cannot format ") + fname;
        return false;
    }
    std::string tmp = std::string(fname) + ".tmp";
    FILE *fp = fopen(tmp.c_str(), "w");
    if (fp == NULL)
    {
        cJSON_free(text);
        err = std::string("cannot write ") + tmp;
        return false;
    }
    bool ok = fputs(text, fp) >= 0 && fputs("\n", fp) >= 0;
    cJSON_free(text);
    if (fclose(fp) != 0)
        ok = false;
    if (not ok)
    {
        remove(tmp.c_str());
        err = std::string("cannot write ") + tmp;
        return false;
    }
    if (rename(tmp.c_str(), fname) != 0)
    {
        remove(tmp.c_str());
        err = std::string("cannot replace ") + fname;
        return false;
    }
    return true;
}

bool WriteSchedule(const char *fname, const planresult_s &res, std::string &err)
{
    cJSON *root = ScheduleToJson(res);
    bool ok = WriteJsonFile(fname, root, err);
    cJSON_Delete(root);
    if (ok)
        WriteLog(LOGINFO, "%s geschrieben, %i Slots", fname, (int)res.series.size());
    return ok;
}

bool WriteDebug(const char *fname, const planresult_s &res, std::string &err)
{
    cJSON *root = DebugToJson(res, 30);
    bool ok = WriteJsonFile(fname, root, err);
    cJSON_Delete(root);
    return ok;
}
