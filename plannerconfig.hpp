//
//  plannerconfig.hpp
//  planner
//

#ifndef plannerconfig_hpp
#define plannerconfig_hpp

#include "plannertypes.hpp"
#include <string>
#include <vector>

#define APPETITES 5

typedef struct {
    bool has_solar, has_battery, has_water_heater;
    char timezone[64];
    float latitude, longitude;
    bool has_location;
    bool weather_fetch;
} system_cfg_s;

typedef struct {
    bool present;
    float capacity_kwh, min_soc_percent, max_soc_percent;
    float max_charge_kw, max_discharge_kw;
    float charge_eff, discharge_eff;
} battery_cfg_s;

typedef struct {
    bool present;
    float cycle_cost, ramping_cost, export_threshold;
    bool enable_export;
} economics_cfg_s;

typedef struct {
    int mode;                       // sindexmode_e
    float base_factor, max_factor, min_factor;
    float pv_deficit_weight, temp_weight;
    float temp_baseline, temp_cold;
    int horizon_days;
    int risk_appetite;              // 1..5
    float base_buffer[APPETITES];
    float buffer_multiplier[APPETITES];
    float target_penalty[APPETITES];
    float sigma[APPETITES];
    float weather_scale, weather_cap;
    float weather_amplification;
    float target_floor;
} sindex_cfg_s;

typedef struct {
    float pv_confidence;
    float percentile, tolerance, smoothing;
    float consolidation_tolerance;
    int max_gap_slots;
    optval_s strategic_target;
    optval_s manual_charge_target, manual_export_target;
} charging_cfg_s;

typedef struct {
    float power_kw, min_hours;
    optval_s min_kwh;
    int max_blocks;
    float defer_hours;
    int plan_days_ahead;
    optval_s consolidation_tolerance;
    int max_gap_slots;              // -1: aus charging_strategy
    bool vacation_mode;
    int al_interval_days;
    float al_duration_hours;
} water_cfg_s;

typedef struct {
    system_cfg_s sys;
    battery_cfg_s battery;
    economics_cfg_s economics;
    sindex_cfg_s sindex;
    charging_cfg_s charging;
    water_cfg_s water;
    int solver_timeout;
    bool learning;
    bool debug;
    char logfile[128];
    char schedule_file[128];
    char debug_file[128];
} planner_config_t;

void DefaultConfig(planner_config_t &cfg);
bool SetConfigValue(planner_config_t &cfg, const char *section, const char *key, const char *value, std::string &err);
bool GetConfig(const char *fname, planner_config_t &cfg, std::string &err);

// "section.key=value"
bool ApplyOverride(planner_config_t &cfg, const char *line, std::string &err);
bool ApplyOverrides(const planner_config_t &base, const std::vector<std::string> &overrides, planner_config_t &out, std::string &err);
bool ReadOverrideFile(const char *fname, std::vector<std::string> &overrides, std::string &err);

bool ValidateConfig(const planner_config_t &cfg, std::string &err);
bool WaterEnabled(const planner_config_t &cfg);
float WaterMinKwh(const planner_config_t &cfg);
float WaterTolerance(const planner_config_t &cfg);
int WaterMaxGap(const planner_config_t &cfg);

#endif /* plannerconfig_hpp */
