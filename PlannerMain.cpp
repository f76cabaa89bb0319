//
//  PlannerMain.cpp
//  planner
//
//  planner -c planner.config.txt -i snapshot.json [-o section.key=value] [-O overrides.txt]
//          [-s schedule.json] [-d planner.debug.json] [-n now] [-q]
//

#include "Planner_CONF.h"
#include "plannerconfig.hpp"
#include "plannerlog.hpp"
#include "plannertime.hpp"
#include "snapshot.hpp"
#include "pipeline.hpp"
#include "schedule.hpp"
#include "greedysolver.hpp"
#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>

static void Usage()
{
    printf("Planner %s\n", VERSION);
    printf("usage: planner [-c config] -i snapshot.json [-o section.key=value]... [-O overridefile]\n");
    printf("               [-s schedule.json] [-d debug.json] [-n now] [-q]\n");
}

int main(int argc, char *argv[])
{
    char conffile[128] = CONF_FILE;
    char snapfile[128] = "";
    char schedfile[128] = "";
    char debugfile[128] = "";
    char nowarg[64] = "";
    bool quiet = false;
    std::vector<std::string> overrides;
    std::string err;

    for (int i = 1; i < argc; i++)
    {
        // Parameter mit Wert
        bool hasvalue = i + 1 < argc;
        if ((strcmp(argv[i], "-config") == 0 || strcmp(argv[i], "-conf") == 0 || strcmp(argv[i], "-c") == 0) && hasvalue)
            snprintf(conffile, sizeof(conffile), "%s", argv[++i]);
        else if (strcmp(argv[i], "-i") == 0 && hasvalue)
            snprintf(snapfile, sizeof(snapfile), "%s", argv[++i]);
        else if (strcmp(argv[i], "-o") == 0 && hasvalue)
            overrides.push_back(argv[++i]);
        else if (strcmp(argv[i], "-O") == 0 && hasvalue)
        {
            if (not ReadOverrideFile(argv[++i], overrides, err))
            {
                fprintf(stderr, "%s\n", err.c_str());
                return 2;
            }
        }
        else if (strcmp(argv[i], "-s") == 0 && hasvalue)
            snprintf(schedfile, sizeof(schedfile), "%s", argv[++i]);
        else if (strcmp(argv[i], "-d") == 0 && hasvalue)
            snprintf(debugfile, sizeof(debugfile), "%s", argv[++i]);
        else if (strcmp(argv[i], "-n") == 0 && hasvalue)
            snprintf(nowarg, sizeof(nowarg), "%s", argv[++i]);
        else if (strcmp(argv[i], "-q") == 0)
            quiet = true;
        else
        {
            Usage();
            return strcmp(argv[i], "-h") == 0 ? 0 : 2;
        }
    }
    if (strlen(snapfile) == 0)
    {
        Usage();
        return 2;
    }

    planner_config_t base;
    DefaultConfig(base);
    if (not GetConfig(conffile, base, err))
    {
        fprintf(stderr, "[ERROR] %s\n", err.c_str());
        return 2;
    }
    // Log und Zeitzone mit den Overrides, die Planung selbst arbeitet auf einer Kopie
    planner_config_t cfg;
    if (not ApplyOverrides(base, overrides, cfg, err) || not ValidateConfig(cfg, err))
    {
        fprintf(stderr, "[ERROR] %s\n", err.c_str());
        return 2;
    }
    LogInit(cfg.logfile, cfg.debug);
    LogQuiet(quiet);
    SetTimezone(cfg.sys.timezone);
    WriteLog(LOGINFO, "Start %s, Konfiguration %s", VERSION, conffile);

    snapshot_s snap;
    if (not ReadSnapshot(snapfile, snap, err))
    {
        WriteLog(LOGERROR, "%s", err.c_str());
        return 1;
    }
    if (strlen(nowarg) > 0)
    {
        time_t now;
        if (not ParseTimestamp(nowarg, now))
        {
            WriteLog(LOGERROR, "ungültige Zeit für -n: %s", nowarg);
            return 2;
        }
        snap.now = now;
    }

    planresult_s res;
    std::shared_ptr<DispatchSolver> solver = std::make_shared<GreedySolver>();
    if (not RunPipeline(snap, cfg, std::vector<std::string>(), solver, tempfetch_t(), res, err))
    {
        WriteLog(LOGERROR, "Planung fehlgeschlagen: %s", err.c_str());
        return 1;
    }

    const char *out = strlen(schedfile) > 0 ? schedfile : cfg.schedule_file;
    if (not WriteSchedule(out, res, err))
    {
        WriteLog(LOGERROR, "%s", err.c_str());
        return 1;
    }
    if (strlen(debugfile) > 0 || cfg.debug)
    {
        const char *dbg = strlen(debugfile) > 0 ? debugfile : cfg.debug_file;
        if (not WriteDebug(dbg, res, err))
        {
            WriteLog(LOGERROR, "%s", err.c_str());
            return 1;
        }
        WriteLog(LOGDEBUG, "Debugdaten in %s", dbg);
    }
    return 0;
}
