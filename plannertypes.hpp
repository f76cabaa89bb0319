//
//  plannertypes.hpp
//  planner
//
//  Gemeinsame Datentypen der Planungskette
//

#ifndef plannertypes_hpp
#define plannertypes_hpp

#include <stdio.h>
#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>
#include <map>

// Wert, der in den Eingangsdaten fehlen darf
typedef struct {bool set; float val;} optval_s;

inline optval_s OptNone() { optval_s o = {false, 0}; return o; }
inline optval_s OptVal(float v) { optval_s o = {true, v}; return o; }
inline float OptOr(const optval_s &o, float fallback) { return o.set ? o.val : fallback; }

enum action_e {ACT_HOLD = 0, ACT_CHARGE, ACT_DISCHARGE, ACT_EXPORT};
enum manual_e {MAN_NONE = 0, MAN_CHARGE, MAN_WATER, MAN_EXPORT, MAN_HOLD};
enum sindexmode_e {SINDEX_STATIC = 0, SINDEX_DYNAMIC, SINDEX_PROBABILISTIC};

const char *ActionName(int action);
const char *ManualName(int manual);

typedef struct {
    time_t hh;                  // Slotbeginn, UTC Sekunden
    time_t end;
    float import_price, export_price;
    float pv, load;             // Prognose kWh je Slot
    float adj_pv, adj_load;     // mit Sicherheitszuschlag
    optval_s pv_p10, pv_p90, load_p10, load_p90;
    bool cheap;
    float water_kw;
    int manual;                 // manual_e
    float charge_kw, discharge_kw;
    float import_kwh, export_kwh;
    float soc_kwh, soc_percent;
    int action;                 // action_e
    float water_pv_kwh, water_batt_kwh, water_grid_kwh;
    optval_s entry_soc;         // Prozent bei Slotbeginn
    float soc_target;
    bool historical;
} slot_s;

typedef std::vector<slot_s> slotseries_t;

// Rohdaten aus dem Snapshot
typedef struct {time_t start; time_t end; optval_s import_price; optval_s export_price;} pricerec_s;
typedef struct {time_t start; optval_s pv, load, pv_p10, pv_p90, load_p10, load_p90;} forecastrec_s;
typedef struct {time_t start; optval_s soc_percent;} historyrec_s;

typedef struct {
    std::string id, action, group, type, classname;
    time_t start, end;
} manualentry_s;

typedef struct {
    std::vector<float> pv_adj;      // 24 Werte je Stunde, kWh je Slot
    std::vector<float> load_adj;
    optval_s base_factor;
} learning_s;

// Tagessummen, Schlüssel ist die lokale Tagesnummer seit 1970
typedef std::map<int, float> dailymap_t;

typedef struct {
    dailymap_t pv, load;
    dailymap_t pv_p10, pv_p50, load_p50, load_p90;
} dailyforecast_s;

typedef struct {
    time_t now;                     // 0 = aktuelle Uhrzeit
    std::vector<pricerec_s> prices;
    std::vector<forecastrec_s> forecasts;
    std::vector<historyrec_s> history;
    dailyforecast_s daily;
    std::map<int, float> temperatures;  // Tagesoffset -> Mitteltemperatur
    bool has_temperatures;
    dailymap_t water_usage;         // bereits erwärmte kWh je Tag
    optval_s battery_kwh, battery_soc_percent, water_heated_today_kwh;
    optval_s cloud_volatility, temp_volatility;
    bool vacation_mode;
    time_t last_anti_legionella;    // 0 = unbekannt
    learning_s learning;
    std::vector<manualentry_s> manual;
} snapshot_s;

// Ergebnisse der Risikoberechnung
typedef struct {
    optval_s factor;                // nicht gesetzt: keine verwertbaren Tage
    float avg_deficit;
    optval_s temp_adjustment;
    float uncertainty;
    std::vector<int> considered_days;
    std::map<int, float> day_deficits;
    std::map<int, float> temperatures;
} loadmargin_s;

typedef struct {
    float effective_load_margin;
    int mode;
    loadmargin_s margin;
    float raw_factor;
    float raw_factor_weather;
    float weather_volatility;
    float risk_factor;
    float multiplier;
    float d1_ratio, d2_ratio, weighted_ratio;
    float pv_contribution, temp_contribution;
    optval_s d2_temperature;
    float target_percent, target_kwh;
    float target_base_buffer, target_weather_adj;
} riskfactors_s;

typedef struct {
    float percentile_price;
    float baseline;
    float threshold;
    bool expanded;
    float target_percent;
    float deficit_kwh;
    float capacity_kwh;
    int needed_slots;
    int cheap_total, cheap_future;
} windowresult_s;

typedef struct {
    std::vector<int> idx;           // Indizes in die Slotreihe
    float avg;
    float pmin, pmax;
} watersegment_s;

typedef struct {
    int day;                        // lokale Tagesnummer
    float required_kwh, consumed_kwh, scheduled_kwh;
    int slots_needed, slots_scheduled;
    int blocks;
    bool deferred;
    int deferred_slots;
    bool anti_legionella;
} waterday_s;

typedef struct {
    bool enabled;
    bool vacation;
    std::vector<waterday_s> days;
    int total_slots;
    float total_kwh;
} waterresult_s;

#endif /* plannertypes_hpp */
