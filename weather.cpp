//
//  weather.cpp
//  planner
//

#include "weather.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "cJSON.h"
#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <algorithm>
#include <string>

bool ParseTemperatures(const char *json, int today, const std::vector<int> &offsets, std::map<int, float> &temps)
{
    temps.clear();
    cJSON *root = cJSON_Parse(json);
    if (root == NULL)
        return false;
    const cJSON *daily = cJSON_GetObjectItemCaseSensitive(root, "daily");
    const cJSON *item1 = cJSON_GetObjectItemCaseSensitive(daily, "time");
    const cJSON *item2 = cJSON_GetObjectItemCaseSensitive(daily, "temperature_2m_mean");
    if (not cJSON_IsArray(item1) || not cJSON_IsArray(item2))
    {
        cJSON_Delete(root);
        return false;
    }
    item1 = item1->child;
    item2 = item2->child;
    while (item1 != NULL && item2 != NULL)
    {
        int day;
        if (cJSON_IsString(item1) && ParseDay(item1->valuestring, day) && cJSON_IsNumber(item2))
        {
            int offset = day - today;
            if (std::find(offsets.begin(), offsets.end(), offset) != offsets.end())
                temps[offset] = item2->valuedouble;
        }
        item1 = item1->next;
        item2 = item2->next;
    }
    cJSON_Delete(root);
    return true;
}

std::map<int, float> FetchTemperatures(const planner_config_t &cfg, int today, const std::vector<int> &offsets)
{
    std::map<int, float> temps;
    if (offsets.size() == 0 || not cfg.sys.has_location)
        return temps;
    int maxoffset = *std::max_element(offsets.begin(), offsets.end());
    char line[512];
    snprintf(line, sizeof(line),
             "curl -s -X GET 'https://api.open-meteo.com/v1/forecast?latitude=%f&longitude=%f&daily=temperature_2m_mean&timezone=%s&forecast_days=%i'",
             cfg.sys.latitude, cfg.sys.longitude, cfg.sys.timezone, std::max(1, maxoffset + 1));

    FILE *fp = popen(line, "r");
    if (fp == NULL)
    {
        WriteLog(LOGWARN, "Temperaturprognose: curl nicht gestartet");
        return temps;
    }
    int fd = fileno(fp);
    int flags = fcntl(fd, F_GETFL, 0);
    flags |= O_NONBLOCK;
    fcntl(fd, F_SETFL, flags);

    std::string text;
    char path[4096];
    int timeout = 0;
    while (timeout < 30)
    {
        if (fgets(path, sizeof(path), fp) != NULL)
            text += path;
        else if (feof(fp))
            break;
        else
        {
            clearerr(fp);
            sleep(1);
            timeout++;
        }
    }
    pclose(fp);
    if (timeout >= 30)
    {
        WriteLog(LOGWARN, "Temperaturprognose: keine Antwort nach %is", timeout);
        return temps;
    }
    if (not ParseTemperatures(text.c_str(), today, offsets, temps))
        WriteLog(LOGWARN, "Temperaturprognose: Antwort nicht lesbar");
    else
        WriteLog(LOGDEBUG, "Temperaturprognose: %i Tage", (int)temps.size());
    return temps;
}

tempfetch_t MakeTempFetcher(const planner_config_t &cfg, const snapshot_s &snap, int today)
{
    if (snap.has_temperatures)
    {
        std::map<int, float> known = snap.temperatures;
        return [known](const std::vector<int> &offsets) -> std::map<int, float>
        {
            std::map<int, float> temps;
            for (size_t k = 0; k < offsets.size(); k++)
            {
                std::map<int, float>::const_iterator it = known.find(offsets[k]);
                if (it != known.end())
                    temps[offsets[k]] = it->second;
            }
            return temps;
        };
    }
    if (cfg.sys.weather_fetch && cfg.sys.has_location)
    {
        planner_config_t c = cfg;
        return [c, today](const std::vector<int> &offsets) -> std::map<int, float>
        {
            return FetchTemperatures(c, today, offsets);
        };
    }
    return [](const std::vector<int> &) -> std::map<int, float>
    {
        return std::map<int, float>();
    };
}
