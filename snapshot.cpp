//
//  snapshot.cpp
//  planner
//

#include "snapshot.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "cJSON.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

void ClearSnapshot(snapshot_s &snap)
{
    snap.now = 0;
    snap.prices.clear();
    snap.forecasts.clear();
    snap.history.clear();
    snap.daily.pv.clear();
    snap.daily.load.clear();
    snap.daily.pv_p10.clear();
    snap.daily.pv_p50.clear();
    snap.daily.load_p50.clear();
    snap.daily.load_p90.clear();
    snap.temperatures.clear();
    snap.has_temperatures = false;
    snap.water_usage.clear();
    snap.battery_kwh = OptNone();
    snap.battery_soc_percent = OptNone();
    snap.water_heated_today_kwh = OptNone();
    snap.cloud_volatility = OptNone();
    snap.temp_volatility = OptNone();
    snap.vacation_mode = false;
    snap.last_anti_legionella = 0;
    snap.learning.pv_adj.clear();
    snap.learning.load_adj.clear();
    snap.learning.base_factor = OptNone();
    snap.manual.clear();
}

bool ReadTextFile(const char *fname, std::string &text)
{
    FILE *fp = fopen(fname, "rb");
    if (fp == NULL)
        return false;
    char buf[4096];
    size_t n;
    text.clear();
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0)
        text.append(buf, n);
    fclose(fp);
    return true;
}

// Zahl oder Zahl als Text, null und fehlend ergeben keinen Wert
static optval_s JsonNum(const cJSON *obj, const char *name)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (cJSON_IsNumber(item))
        return OptVal((float)item->valuedouble);
    if (cJSON_IsString(item) && item->valuestring != NULL)
    {
        char *end = NULL;
        double d = strtod(item->valuestring, &end);
        if (end != item->valuestring && *end == 0)
            return OptVal((float)d);
    }
    return OptNone();
}

static bool JsonTime(const cJSON *item, time_t &t)
{
    if (cJSON_IsNumber(item))
    {
        double v = item->valuedouble;
        if (v > 1e11)
            v = v / 1000;
        t = (time_t)v;
        return true;
    }
    if (cJSON_IsString(item) && item->valuestring != NULL)
        return ParseTimestamp(item->valuestring, t);
    return false;
}

static std::string JsonText(const cJSON *obj, const char *name)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (cJSON_IsString(item) && item->valuestring != NULL)
        return item->valuestring;
    if (cJSON_IsNumber(item))
    {
        char buf[32];
        snprintf(buf, sizeof(buf), "%i", item->valueint);
        return buf;
    }
    return "";
}

static bool JsonBool(const cJSON *obj, const char *name, bool fallback)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (cJSON_IsBool(item))
        return cJSON_IsTrue(item);
    if (cJSON_IsNumber(item))
        return item->valueint != 0;
    return fallback;
}

static void ReadDailyMap(const cJSON *obj, const char *name, dailymap_t &map)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (not cJSON_IsObject(item))
        return;
    for (const cJSON *e = item->child; e != NULL; e = e->next)
    {
        int day;
        if (e->string == NULL || not ParseDay(e->string, day))
        {
            WriteLog(LOGWARN, "%s: ungültiges Datum %s", name, e->string ? e->string : "");
            continue;
        }
        if (cJSON_IsNumber(e))
            map[day] = (float)e->valuedouble;
    }
}

static void ReadHourTable(const cJSON *obj, const char *name, std::vector<float> &table)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    table.clear();
    if (not cJSON_IsArray(item))
        return;
    for (const cJSON *e = item->child; e != NULL; e = e->next)
        table.push_back(cJSON_IsNumber(e) ? (float)e->valuedouble : 0);
    if (table.size() != 24)
    {
        WriteLog(LOGWARN, "%s: %i statt 24 Stundenwerte, ignoriert", name, (int)table.size());
        table.clear();
    }
}

static void ReadPrices(const cJSON *root, snapshot_s &snap)
{
    const cJSON *arr = cJSON_GetObjectItemCaseSensitive(root, "price_data");
    if (not cJSON_IsArray(arr))
        return;
    for (const cJSON *e = arr->child; e != NULL; e = e->next)
    {
        pricerec_s p;
        if (not JsonTime(cJSON_GetObjectItemCaseSensitive(e, "start_time"), p.start))
        {
            WriteLog(LOGWARN, "price_data: Eintrag ohne gültige start_time ignoriert");
            continue;
        }
        if (not JsonTime(cJSON_GetObjectItemCaseSensitive(e, "end_time"), p.end))
            p.end = 0;
        p.import_price = JsonNum(e, "import_price_sek_kwh");
        p.export_price = JsonNum(e, "export_price_sek_kwh");
        snap.prices.push_back(p);
    }
}

static void ReadForecasts(const cJSON *root, snapshot_s &snap)
{
    const cJSON *arr = cJSON_GetObjectItemCaseSensitive(root, "forecast_data");
    if (not cJSON_IsArray(arr))
        return;
    for (const cJSON *e = arr->child; e != NULL; e = e->next)
    {
        forecastrec_s f;
        if (not JsonTime(cJSON_GetObjectItemCaseSensitive(e, "start_time"), f.start))
        {
            WriteLog(LOGWARN, "forecast_data: Eintrag ohne gültige start_time ignoriert");
            continue;
        }
        f.pv = JsonNum(e, "pv_forecast_kwh");
        f.load = JsonNum(e, "load_forecast_kwh");
        f.pv_p10 = JsonNum(e, "pv_p10");
        f.pv_p90 = JsonNum(e, "pv_p90");
        f.load_p10 = JsonNum(e, "load_p10");
        f.load_p90 = JsonNum(e, "load_p90");
        snap.forecasts.push_back(f);
    }
}

static void ReadHistory(const cJSON *root, snapshot_s &snap)
{
    const cJSON *arr = cJSON_GetObjectItemCaseSensitive(root, "history");
    if (not cJSON_IsArray(arr))
        return;
    for (const cJSON *e = arr->child; e != NULL; e = e->next)
    {
        historyrec_s h;
        if (not JsonTime(cJSON_GetObjectItemCaseSensitive(e, "start_time"), h.start))
            continue;
        h.soc_percent = JsonNum(e, "soc_percent");
        snap.history.push_back(h);
    }
}

static void ReadManualPlan(const cJSON *root, snapshot_s &snap)
{
    const cJSON *plan = cJSON_GetObjectItemCaseSensitive(root, "manual_plan");
    if (cJSON_IsObject(plan))
    {
        const char *names[] = {"plan", "schedule", "items"};
        const cJSON *inner = NULL;
        for (int j = 0; j < 3 && not cJSON_IsArray(inner); j++)
            inner = cJSON_GetObjectItemCaseSensitive(plan, names[j]);
        plan = inner;
    }
    if (not cJSON_IsArray(plan))
        return;
    for (const cJSON *e = plan->child; e != NULL; e = e->next)
    {
        manualentry_s m;
        m.action = JsonText(e, "content");
        if (m.action.empty()) m.action = JsonText(e, "action");
        if (m.action.empty()) m.action = JsonText(e, "title");
        m.id = JsonText(e, "id");
        m.group = JsonText(e, "group");
        m.type = JsonText(e, "type");
        m.classname = JsonText(e, "className");
        const cJSON *s = cJSON_GetObjectItemCaseSensitive(e, "start");
        if (s == NULL) s = cJSON_GetObjectItemCaseSensitive(e, "start_time");
        const cJSON *t = cJSON_GetObjectItemCaseSensitive(e, "end");
        if (t == NULL) t = cJSON_GetObjectItemCaseSensitive(e, "end_time");
        if (not JsonTime(s, m.start) || not JsonTime(t, m.end))
        {
            WriteLog(LOGWARN, "manual_plan: Eintrag %s ohne gültige Zeit ignoriert", m.id.c_str());
            continue;
        }
        snap.manual.push_back(m);
    }
}

bool ParseSnapshot(const char *json, snapshot_s &snap, std::string &err)
{
    ClearSnapshot(snap);
    cJSON *root = cJSON_Parse(json);
    if (root == NULL)
    {
        const char *pos = cJSON_GetErrorPtr();
        err = "snapshot is not valid JSON";
        if (pos != NULL)
            err += std::string(" near: ") + std::string(pos).substr(0, 40);
        return false;
    }
    if (not cJSON_IsObject(root))
    {
        cJSON_Delete(root);
        err = "snapshot must be a JSON object";
        return false;
    }
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(root, "now");
    if (item != NULL && not JsonTime(item, snap.now))
    {
        cJSON_Delete(root);
        err = "snapshot: invalid now";
        return false;
    }

    ReadPrices(root, snap);
    ReadForecasts(root, snap);
    ReadHistory(root, snap);
    ReadDailyMap(root, "daily_pv_forecast", snap.daily.pv);
    ReadDailyMap(root, "daily_load_forecast", snap.daily.load);
    item = cJSON_GetObjectItemCaseSensitive(root, "daily_probabilistic");
    if (cJSON_IsObject(item))
    {
        ReadDailyMap(item, "pv_p10", snap.daily.pv_p10);
        ReadDailyMap(item, "pv_p50", snap.daily.pv_p50);
        ReadDailyMap(item, "load_p50", snap.daily.load_p50);
        ReadDailyMap(item, "load_p90", snap.daily.load_p90);
    }
    ReadDailyMap(root, "water_usage_kwh", snap.water_usage);

    // Tagesoffset -> Mitteltemperatur
    item = cJSON_GetObjectItemCaseSensitive(root, "temperatures");
    if (cJSON_IsObject(item))
    {
        snap.has_temperatures = true;
        for (const cJSON *e = item->child; e != NULL; e = e->next)
            if (e->string != NULL && cJSON_IsNumber(e))
                snap.temperatures[atoi(e->string)] = (float)e->valuedouble;
    }

    item = cJSON_GetObjectItemCaseSensitive(root, "initial_state");
    if (cJSON_IsObject(item))
    {
        snap.battery_kwh = JsonNum(item, "battery_kwh");
        if (not snap.battery_kwh.set)
            snap.battery_kwh = JsonNum(item, "battery_soc_kwh");
        snap.battery_soc_percent = JsonNum(item, "battery_soc_percent");
        snap.water_heated_today_kwh = JsonNum(item, "water_heated_today_kwh");
        snap.vacation_mode = JsonBool(item, "vacation_mode", false);
        time_t t;
        if (JsonTime(cJSON_GetObjectItemCaseSensitive(item, "last_anti_legionella_at"), t))
            snap.last_anti_legionella = t;
    }

    item = cJSON_GetObjectItemCaseSensitive(root, "weather_volatility");
    if (cJSON_IsObject(item))
    {
        snap.cloud_volatility = JsonNum(item, "cloud");
        snap.temp_volatility = JsonNum(item, "temp");
    }

    item = cJSON_GetObjectItemCaseSensitive(root, "learning");
    if (cJSON_IsObject(item))
    {
        ReadHourTable(item, "pv_adjustment_by_hour_kwh", snap.learning.pv_adj);
        ReadHourTable(item, "load_adjustment_by_hour_kwh", snap.learning.load_adj);
        snap.learning.base_factor = JsonNum(item, "s_index_base_factor");
    }

    ReadManualPlan(root, snap);
    cJSON_Delete(root);
    WriteLog(LOGDEBUG, "snapshot: %i Preise, %i Prognosen, %i Historie, %i manuelle Einträge",
             (int)snap.prices.size(), (int)snap.forecasts.size(), (int)snap.history.size(), (int)snap.manual.size());
    return true;
}

bool ReadSnapshot(const char *fname, snapshot_s &snap, std::string &err)
{
    std::string text;
    if (not ReadTextFile(fname, text))
    {
        err = std::string("cannot read snapshot ") + fname;
        return false;
    }
    return ParseSnapshot(text.c_str(), snap, err);
}
