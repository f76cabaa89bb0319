//
//  plannerconfig.cpp
//  planner
//
//  Konfigurationsdatei einlesen, Overrides anwenden, prüfen
//

#include "plannerconfig.hpp"
#include "plannerlog.hpp"
#include "plannertime.hpp"
#include "Planner_CONF.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>

static const float base_buffer_def[APPETITES] = {35, 20, 10, 3, -7};
static const float multiplier_def[APPETITES] = {1.5, 1.2, 1.0, 0.5, -0.5};
static const float penalty_def[APPETITES] = {20, 14, 8, 5, 2};
static const float sigma_def[APPETITES] = {1.28, 0.67, 0.0, -0.25, -0.67};

void DefaultConfig(planner_config_t &cfg)
{
    memset(&cfg, 0, sizeof(cfg));
    cfg.sys.has_solar = true;
    cfg.sys.has_battery = true;
    cfg.sys.has_water_heater = true;
    strcpy(cfg.sys.timezone, TIMEZONE);
    cfg.sys.weather_fetch = false;

    cfg.battery.present = false;
    cfg.battery.capacity_kwh = CAPACITY_KWH;
    cfg.battery.min_soc_percent = MINSOC;
    cfg.battery.max_soc_percent = MAXSOC;
    cfg.battery.max_charge_kw = MAXCHARGEKW;
    cfg.battery.max_discharge_kw = MAXDISCHARGEKW;
    cfg.battery.charge_eff = EFFICIENCY;
    cfg.battery.discharge_eff = EFFICIENCY;

    cfg.economics.present = false;
    cfg.economics.enable_export = true;

    cfg.sindex.mode = SINDEX_DYNAMIC;
    cfg.sindex.base_factor = BASEFACTOR;
    cfg.sindex.max_factor = MAXFACTOR;
    cfg.sindex.min_factor = MINFACTOR;
    cfg.sindex.pv_deficit_weight = PVDEFICITWEIGHT;
    cfg.sindex.temp_weight = 0;
    cfg.sindex.temp_baseline = TEMPBASELINE;
    cfg.sindex.temp_cold = TEMPCOLD;
    cfg.sindex.horizon_days = SINDEXDAYS;
    cfg.sindex.risk_appetite = RISKAPPETITE;
    for (int j = 0; j < APPETITES; j++)
    {
        cfg.sindex.base_buffer[j] = base_buffer_def[j];
        cfg.sindex.buffer_multiplier[j] = multiplier_def[j];
        cfg.sindex.target_penalty[j] = penalty_def[j];
        cfg.sindex.sigma[j] = sigma_def[j];
    }
    cfg.sindex.weather_scale = WEATHERSCALE;
    cfg.sindex.weather_cap = WEATHERCAP;
    cfg.sindex.weather_amplification = WEATHERAMPLIFICATION;
    cfg.sindex.target_floor = TARGETFLOOR;

    cfg.charging.pv_confidence = PVCONFIDENCE;
    cfg.charging.percentile = CHARGEPERCENTILE;
    cfg.charging.tolerance = CHEAPTOLERANCE;
    cfg.charging.smoothing = PRICESMOOTHING;
    cfg.charging.consolidation_tolerance = 0;
    cfg.charging.max_gap_slots = 0;
    cfg.charging.strategic_target = OptNone();
    cfg.charging.manual_charge_target = OptNone();
    cfg.charging.manual_export_target = OptNone();

    cfg.water.power_kw = WATERPOWERKW;
    cfg.water.min_hours = WATERMINHOURS;
    cfg.water.min_kwh = OptNone();
    cfg.water.max_blocks = WATERMAXBLOCKS;
    cfg.water.defer_hours = 0;
    cfg.water.plan_days_ahead = 1;
    cfg.water.consolidation_tolerance = OptNone();
    cfg.water.max_gap_slots = -1;
    cfg.water.vacation_mode = false;
    cfg.water.al_interval_days = ALINTERVALDAYS;
    cfg.water.al_duration_hours = ALDURATIONHOURS;

    cfg.solver_timeout = SOLVERTIMEOUT;
    cfg.learning = true;
    cfg.debug = false;
    strcpy(cfg.logfile, "");
    strcpy(cfg.schedule_file, SCHEDULE_FILE);
    strcpy(cfg.debug_file, DEBUG_FILE);
}

static void Lower(char *s)
{
    for (; *s; s++) *s = tolower((unsigned char)*s);
}

static bool ParseBool(const char *value, bool &b)
{
    char v[16];
    snprintf(v, sizeof(v), "%s", value);
    Lower(v);
    if (strcmp(v, "true") == 0 || strcmp(v, "1") == 0 || strcmp(v, "yes") == 0 || strcmp(v, "on") == 0)
        b = true;
    else if (strcmp(v, "false") == 0 || strcmp(v, "0") == 0 || strcmp(v, "no") == 0 || strcmp(v, "off") == 0)
        b = false;
    else
        return false;
    return true;
}

static bool ParseFloat(const char *value, float &f)
{
    char *end = NULL;
    double d = strtod(value, &end);
    if (end == value || *end != 0)
        return false;
    f = (float)d;
    return true;
}

static bool ParseInt(const char *value, int &i)
{
    char *end = NULL;
    long l = strtol(value, &end, 10);
    if (end == value || *end != 0)
        return false;
    i = (int)l;
    return true;
}

static bool ParseOpt(const char *value, optval_s &o)
{
    float f;
    if (strcmp(value, "none") == 0 || strcmp(value, "null") == 0)
    {
        o = OptNone();
        return true;
    }
    if (not ParseFloat(value, f))
        return false;
    o = OptVal(f);
    return true;
}

// Tabelle je Risikostufe 1..5: "35,20,10,3,-7"
static bool ParseTable(const char *value, float table[APPETITES])
{
    float t[APPETITES];
    if (sscanf(value, "%f , %f , %f , %f , %f", &t[0], &t[1], &t[2], &t[3], &t[4]) != APPETITES)
        return false;
    for (int j = 0; j < APPETITES; j++)
        table[j] = t[j];
    return true;
}

bool SetConfigValue(planner_config_t &cfg, const char *section, const char *key, const char *value, std::string &err)
{
    char sect[64], var[128];
    snprintf(sect, sizeof(sect), "%s", section);
    snprintf(var, sizeof(var), "%s", key);
    Lower(sect);
    Lower(var);
    bool ok = true;
    bool known = true;

    if (strcmp(sect, "system") == 0)
    {
        if (strcmp(var, "has_solar") == 0)
            ok = ParseBool(value, cfg.sys.has_solar);
        else if (strcmp(var, "has_battery") == 0)
            ok = ParseBool(value, cfg.sys.has_battery);
        else if (strcmp(var, "has_water_heater") == 0)
            ok = ParseBool(value, cfg.sys.has_water_heater);
        else if (strcmp(var, "timezone") == 0)
            snprintf(cfg.sys.timezone, sizeof(cfg.sys.timezone), "%s", value);
        else if (strcmp(var, "latitude") == 0)
        {
            ok = ParseFloat(value, cfg.sys.latitude);
            cfg.sys.has_location = ok;
        }
        else if (strcmp(var, "longitude") == 0)
            ok = ParseFloat(value, cfg.sys.longitude);
        else if (strcmp(var, "weather_fetch") == 0)
            ok = ParseBool(value, cfg.sys.weather_fetch);
        else
            known = false;
    }
    else if (strcmp(sect, "battery") == 0)
    {
        cfg.battery.present = true;
        if (strcmp(var, "capacity_kwh") == 0)
            ok = ParseFloat(value, cfg.battery.capacity_kwh);
        else if (strcmp(var, "min_soc_percent") == 0)
            ok = ParseFloat(value, cfg.battery.min_soc_percent);
        else if (strcmp(var, "max_soc_percent") == 0)
            ok = ParseFloat(value, cfg.battery.max_soc_percent);
        else if (strcmp(var, "max_charge_power_kw") == 0)
            ok = ParseFloat(value, cfg.battery.max_charge_kw);
        else if (strcmp(var, "max_discharge_power_kw") == 0)
            ok = ParseFloat(value, cfg.battery.max_discharge_kw);
        else if (strcmp(var, "charge_efficiency") == 0)
            ok = ParseFloat(value, cfg.battery.charge_eff);
        else if (strcmp(var, "discharge_efficiency") == 0)
            ok = ParseFloat(value, cfg.battery.discharge_eff);
        else
            known = false;
    }
    else if (strcmp(sect, "battery_economics") == 0)
    {
        cfg.economics.present = true;
        if (strcmp(var, "battery_cycle_cost_kwh") == 0)
            ok = ParseFloat(value, cfg.economics.cycle_cost);
        else if (strcmp(var, "ramping_cost_kw") == 0)
            ok = ParseFloat(value, cfg.economics.ramping_cost);
        else if (strcmp(var, "export_threshold_kwh") == 0)
            ok = ParseFloat(value, cfg.economics.export_threshold);
        else
            known = false;
    }
    else if (strcmp(sect, "export") == 0)
    {
        if (strcmp(var, "enable_export") == 0)
            ok = ParseBool(value, cfg.economics.enable_export);
        else
            known = false;
    }
    else if (strcmp(sect, "s_index") == 0)
    {
        if (strcmp(var, "mode") == 0)
        {
            if (strcmp(value, "static") == 0) cfg.sindex.mode = SINDEX_STATIC;
            else if (strcmp(value, "dynamic") == 0) cfg.sindex.mode = SINDEX_DYNAMIC;
            else if (strcmp(value, "probabilistic") == 0) cfg.sindex.mode = SINDEX_PROBABILISTIC;
            else ok = false;
        }
        else if (strcmp(var, "base_factor") == 0 || strcmp(var, "static_factor") == 0)
            ok = ParseFloat(value, cfg.sindex.base_factor);
        else if (strcmp(var, "max_factor") == 0)
            ok = ParseFloat(value, cfg.sindex.max_factor);
        else if (strcmp(var, "min_factor") == 0)
            ok = ParseFloat(value, cfg.sindex.min_factor);
        else if (strcmp(var, "pv_deficit_weight") == 0)
            ok = ParseFloat(value, cfg.sindex.pv_deficit_weight);
        else if (strcmp(var, "temp_weight") == 0)
            ok = ParseFloat(value, cfg.sindex.temp_weight);
        else if (strcmp(var, "temp_baseline_c") == 0)
            ok = ParseFloat(value, cfg.sindex.temp_baseline);
        else if (strcmp(var, "temp_cold_c") == 0)
            ok = ParseFloat(value, cfg.sindex.temp_cold);
        else if (strcmp(var, "s_index_horizon_days") == 0 || strcmp(var, "horizon_days") == 0)
            ok = ParseInt(value, cfg.sindex.horizon_days);
        else if (strcmp(var, "risk_appetite") == 0)
            ok = ParseInt(value, cfg.sindex.risk_appetite);
        else if (strcmp(var, "base_buffer") == 0)
            ok = ParseTable(value, cfg.sindex.base_buffer);
        else if (strcmp(var, "buffer_multiplier") == 0)
            ok = ParseTable(value, cfg.sindex.buffer_multiplier);
        else if (strcmp(var, "target_penalty") == 0)
            ok = ParseTable(value, cfg.sindex.target_penalty);
        else if (strcmp(var, "sigma") == 0)
            ok = ParseTable(value, cfg.sindex.sigma);
        else if (strcmp(var, "weather_scale") == 0)
            ok = ParseFloat(value, cfg.sindex.weather_scale);
        else if (strcmp(var, "weather_cap") == 0)
            ok = ParseFloat(value, cfg.sindex.weather_cap);
        else if (strcmp(var, "weather_amplification") == 0)
            ok = ParseFloat(value, cfg.sindex.weather_amplification);
        else if (strcmp(var, "target_floor_percent") == 0)
            ok = ParseFloat(value, cfg.sindex.target_floor);
        else
            known = false;
    }
    else if (strcmp(sect, "forecasting") == 0)
    {
        if (strcmp(var, "pv_confidence_percent") == 0)
            ok = ParseFloat(value, cfg.charging.pv_confidence);
        else
            known = false;
    }
    else if (strcmp(sect, "charging_strategy") == 0)
    {
        if (strcmp(var, "charge_threshold_percentile") == 0)
            ok = ParseFloat(value, cfg.charging.percentile);
        else if (strcmp(var, "cheap_price_tolerance") == 0)
            ok = ParseFloat(value, cfg.charging.tolerance);
        else if (strcmp(var, "price_smoothing") == 0)
            ok = ParseFloat(value, cfg.charging.smoothing);
        else if (strcmp(var, "block_consolidation_tolerance") == 0)
            ok = ParseFloat(value, cfg.charging.consolidation_tolerance);
        else if (strcmp(var, "consolidation_max_gap_slots") == 0)
            ok = ParseInt(value, cfg.charging.max_gap_slots);
        else
            known = false;
    }
    else if (strcmp(sect, "strategic_charging") == 0)
    {
        if (strcmp(var, "target_soc_percent") == 0)
            ok = ParseOpt(value, cfg.charging.strategic_target);
        else
            known = false;
    }
    else if (strcmp(sect, "manual_planning") == 0)
    {
        if (strcmp(var, "charge_target_percent") == 0)
            ok = ParseOpt(value, cfg.charging.manual_charge_target);
        else if (strcmp(var, "export_target_percent") == 0)
            ok = ParseOpt(value, cfg.charging.manual_export_target);
        else
            known = false;
    }
    else if (strcmp(sect, "water_heating") == 0)
    {
        if (strcmp(var, "power_kw") == 0)
            ok = ParseFloat(value, cfg.water.power_kw);
        else if (strcmp(var, "min_hours_per_day") == 0)
            ok = ParseFloat(value, cfg.water.min_hours);
        else if (strcmp(var, "min_kwh_per_day") == 0)
            ok = ParseOpt(value, cfg.water.min_kwh);
        else if (strcmp(var, "max_blocks_per_day") == 0)
            ok = ParseInt(value, cfg.water.max_blocks);
        else if (strcmp(var, "defer_up_to_hours") == 0)
            ok = ParseFloat(value, cfg.water.defer_hours);
        else if (strcmp(var, "plan_days_ahead") == 0)
        {
            ok = ParseInt(value, cfg.water.plan_days_ahead);
            if (ok && (cfg.water.plan_days_ahead < 0 || cfg.water.plan_days_ahead > 1))
            {
                WriteLog(LOGWARN, "water_heating.plan_days_ahead=%i, begrenzt auf 0..1", cfg.water.plan_days_ahead);
                cfg.water.plan_days_ahead = cfg.water.plan_days_ahead < 0 ? 0 : 1;
            }
        }
        else if (strcmp(var, "block_consolidation_tolerance") == 0)
            ok = ParseOpt(value, cfg.water.consolidation_tolerance);
        else if (strcmp(var, "consolidation_max_gap_slots") == 0)
            ok = ParseInt(value, cfg.water.max_gap_slots);
        else if (strcmp(var, "vacation_mode") == 0)
            ok = ParseBool(value, cfg.water.vacation_mode);
        else if (strcmp(var, "anti_legionella_interval_days") == 0)
            ok = ParseInt(value, cfg.water.al_interval_days);
        else if (strcmp(var, "anti_legionella_duration_hours") == 0)
            ok = ParseFloat(value, cfg.water.al_duration_hours);
        else
            known = false;
    }
    else if (strcmp(sect, "solver") == 0)
    {
        if (strcmp(var, "timeout_seconds") == 0)
            ok = ParseInt(value, cfg.solver_timeout);
        else
            known = false;
    }
    else if (strcmp(sect, "learning") == 0)
    {
        if (strcmp(var, "enable") == 0)
            ok = ParseBool(value, cfg.learning);
        else
            known = false;
    }
    else if (strcmp(sect, "general") == 0)
    {
        if (strcmp(var, "debug") == 0)
            ok = ParseBool(value, cfg.debug);
        else if (strcmp(var, "logfile") == 0)
            snprintf(cfg.logfile, sizeof(cfg.logfile), "%s", value);
        else if (strcmp(var, "schedule_file") == 0)
            snprintf(cfg.schedule_file, sizeof(cfg.schedule_file), "%s", value);
        else if (strcmp(var, "debug_file") == 0)
            snprintf(cfg.debug_file, sizeof(cfg.debug_file), "%s", value);
        else
            known = false;
    }
    else
        known = false;

    if (not known)
    {
        WriteLog(LOGWARN, "unbekannter Eintrag %s.%s ignoriert", sect, var);
        return true;
    }
    if (not ok)
    {
        err = std::string("invalid value for ") + sect + "." + var + ": " + value;
        return false;
    }
    return true;
}

// Kommentar und Zeilenende abschneiden
static void StripLine(char *line)
{
    char *p = strchr(line, '#');
    if (p != NULL) *p = 0;
    size_t len = strlen(line);
    while (len > 0 && isspace((unsigned char)line[len - 1]))
        line[--len] = 0;
}

bool GetConfig(const char *fname, planner_config_t &cfg, std::string &err)
{
    FILE *fp;
    char line[512];
    char section[64] = "general";
    char var[128], value[256];
    int lineno = 0;

    fp = fopen(fname, "r");
    if (fp == NULL)
    {
        err = std::string("config file not found: ") + fname;
        return false;
    }
    while (fgets(line, sizeof(line), fp))
    {
        lineno++;
        StripLine(line);
        memset(var, 0, sizeof(var));
        memset(value, 0, sizeof(value));
        if (sscanf(line, " [%63[^]]]", section) == 1)
        {
            Lower(section);
            if (strcmp(section, "battery") == 0)
                cfg.battery.present = true;
            if (strcmp(section, "battery_economics") == 0)
                cfg.economics.present = true;
            continue;
        }
        if (sscanf(line, " %127[^ \t=] = %255[^\n]", var, value) == 2)
        {
            if (not SetConfigValue(cfg, section, var, value, err))
            {
                char nr[32];
                snprintf(nr, sizeof(nr), " (%s:%i)", fname, lineno);
                err += nr;
                fclose(fp);
                return false;
            }
        }
        else if (strlen(var) > 0 || line[strspn(line, " \t")] != 0)
            WriteLog(LOGWARN, "%s:%i nicht lesbar: %s", fname, lineno, line);
    }
    fclose(fp);
    return true;
}

bool ApplyOverride(planner_config_t &cfg, const char *line, std::string &err)
{
    char section[64], var[128], value[256];
    char buf[512];
    snprintf(buf, sizeof(buf), "%s", line);
    StripLine(buf);
    if (sscanf(buf, " %63[^.= \t] . %127[^= \t] = %255[^\n]", section, var, value) != 3)
    {
        err = std::string("override must look like section.key=value: ") + line;
        return false;
    }
    return SetConfigValue(cfg, section, var, value, err);
}

bool ApplyOverrides(const planner_config_t &base, const std::vector<std::string> &overrides, planner_config_t &out, std::string &err)
{
    planner_config_t cfg = base;
    for (size_t j = 0; j < overrides.size(); j++)
    {
        if (not ApplyOverride(cfg, overrides[j].c_str(), err))
            return false;
    }
    out = cfg;
    return true;
}

bool ReadOverrideFile(const char *fname, std::vector<std::string> &overrides, std::string &err)
{
    FILE *fp;
    char line[512];
    fp = fopen(fname, "r");
    if (fp == NULL)
    {
        err = std::string("override file not found: ") + fname;
        return false;
    }
    while (fgets(line, sizeof(line), fp))
    {
        StripLine(line);
        if (line[strspn(line, " \t")] != 0)
            overrides.push_back(line);
    }
    fclose(fp);
    return true;
}

bool ValidateConfig(const planner_config_t &cfg, std::string &err)
{
    if (not cfg.battery.present)
    {
        err = "Missing required config section: battery";
        return false;
    }
    if (not cfg.economics.present)
    {
        err = "Missing required config section: battery_economics";
        return false;
    }
    if (cfg.sys.has_battery && cfg.battery.capacity_kwh <= 0)
    {
        err = "system.has_battery is true but battery.capacity_kwh is not set (or is 0)";
        return false;
    }
    if (cfg.battery.min_soc_percent < 0 || cfg.battery.min_soc_percent > 100)
    {
        err = "battery.min_soc_percent must be within 0..100";
        return false;
    }
    if (cfg.battery.max_soc_percent <= cfg.battery.min_soc_percent || cfg.battery.max_soc_percent > 100)
    {
        err = "battery.max_soc_percent must be above min_soc_percent and at most 100";
        return false;
    }
    if (cfg.battery.max_charge_kw < 0 || cfg.battery.max_discharge_kw < 0)
    {
        err = "battery charge/discharge power must not be negative";
        return false;
    }
    if (cfg.battery.charge_eff <= 0 || cfg.battery.charge_eff > 1
        || cfg.battery.discharge_eff <= 0 || cfg.battery.discharge_eff > 1)
    {
        err = "battery efficiencies must be within (0, 1]";
        return false;
    }
    if (cfg.sindex.risk_appetite < 1 || cfg.sindex.risk_appetite > APPETITES)
    {
        err = "s_index.risk_appetite must be within 1..5";
        return false;
    }
    if (cfg.sindex.max_factor <= 0 || cfg.sindex.min_factor > cfg.sindex.max_factor)
    {
        err = "s_index.min_factor must not exceed s_index.max_factor";
        return false;
    }
    if (cfg.sindex.horizon_days < 1 || cfg.sindex.horizon_days > 14)
    {
        err = "s_index.s_index_horizon_days must be within 1..14";
        return false;
    }
    if (cfg.sindex.weather_cap < 0)
    {
        err = "s_index.weather_cap must not be negative";
        return false;
    }
    for (int j = 1; j < APPETITES; j++)
    {
        if (cfg.sindex.base_buffer[j] > cfg.sindex.base_buffer[j - 1])
        {
            err = "s_index.base_buffer must decrease with risk appetite";
            return false;
        }
    }
    if (cfg.charging.percentile < 0 || cfg.charging.percentile > 100)
    {
        err = "charging_strategy.charge_threshold_percentile must be within 0..100";
        return false;
    }
    if (cfg.charging.pv_confidence < 0)
    {
        err = "forecasting.pv_confidence_percent must not be negative";
        return false;
    }
    if (cfg.water.max_blocks < 1)
    {
        err = "water_heating.max_blocks_per_day must be at least 1";
        return false;
    }
    if (cfg.water.defer_hours < 0)
    {
        err = "water_heating.defer_up_to_hours must not be negative";
        return false;
    }
    if (cfg.solver_timeout <= 0)
    {
        err = "solver.timeout_seconds must be positive";
        return false;
    }
    if (strlen(cfg.sys.timezone) == 0)
    {
        err = "system.timezone must be set";
        return false;
    }
    if (not KnownTimezone(cfg.sys.timezone))
    {
        err = std::string("system.timezone unknown: ") + cfg.sys.timezone;
        return false;
    }
    if (cfg.sys.has_water_heater && cfg.water.power_kw <= 0)
        WriteLog(LOGWARN, "has_water_heater=true but water_heating.power_kw=0, water heating disabled");
    if (cfg.sys.weather_fetch && not cfg.sys.has_location)
        WriteLog(LOGWARN, "system.weather_fetch=true but no latitude/longitude set");
    return true;
}

bool WaterEnabled(const planner_config_t &cfg)
{
    return cfg.sys.has_water_heater && cfg.water.power_kw > 0;
}

float WaterMinKwh(const planner_config_t &cfg)
{
    return OptOr(cfg.water.min_kwh, cfg.water.power_kw * cfg.water.min_hours);
}

float WaterTolerance(const planner_config_t &cfg)
{
    return OptOr(cfg.water.consolidation_tolerance, cfg.charging.consolidation_tolerance);
}

int WaterMaxGap(const planner_config_t &cfg)
{
    return cfg.water.max_gap_slots >= 0 ? cfg.water.max_gap_slots : cfg.charging.max_gap_slots;
}
