//
//  pipeline.cpp
//  planner
//

#include "pipeline.hpp"
#include "dataprep.hpp"
#include "windows.hpp"
#include "waterheating.hpp"
#include "greedysolver.hpp"
#include "manualplan.hpp"
#include "soctarget.hpp"
#include "weather.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>

static const char *ModeName(int mode)
{
    switch (mode)
    {
        case SINDEX_STATIC: return "static";
        case SINDEX_PROBABILISTIC: return "probabilistic";
        default: return "dynamic";
    }
}

static float InitialSoc(const snapshot_s &snap, const planner_config_t &cfg)
{
    if (not cfg.sys.has_battery)
        return 0;
    float capacity = cfg.battery.capacity_kwh;
    float soc;
    if (snap.battery_kwh.set)
        soc = snap.battery_kwh.val;
    else if (snap.battery_soc_percent.set)
        soc = snap.battery_soc_percent.val / 100 * capacity;
    else
    {
        soc = cfg.battery.min_soc_percent / 100 * capacity;
        WriteLog(LOGWARN, "kein Batteriestand im Snapshot, Start mit min_soc %.2f kWh", soc);
    }
    return std::max(0.0f, std::min(capacity, soc));
}

bool RunPipeline(const snapshot_s &snap, const planner_config_t &base, const std::vector<std::string> &overrides,
                 std::shared_ptr<DispatchSolver> solver, tempfetch_t fetch, planresult_s &result, std::string &err)
{
    planresult_s res = planresult_s();

    // Configure
    if (not ApplyOverrides(base, overrides, res.cfg, err))
        return false;
    if (not ValidateConfig(res.cfg, err))
        return false;
    planner_config_t &cfg = res.cfg;
    // Zeitzone gilt nur für diesen Lauf
    TimezoneScope tzscope(cfg.sys.timezone);
    if (cfg.learning && snap.learning.base_factor.set && snap.learning.base_factor.val > 0)
    {
        WriteLog(LOGINFO, "gelernter Basisfaktor %.3f statt %.3f", snap.learning.base_factor.val, cfg.sindex.base_factor);
        cfg.sindex.base_factor = snap.learning.base_factor.val;
    }
    res.now = FloorSlot(snap.now > 0 ? snap.now : time(NULL));
    res.today = LocalDay(res.now);
    if (not fetch)
        fetch = MakeTempFetcher(cfg, snap, res.today);
    if (not solver)
        solver = std::make_shared<GreedySolver>();
    res.solver = solver->Name();

    // Prepare
    PrepareSlots(snap, res.series);
    if (res.series.size() == 0)
        WriteLog(LOGWARN, "keine Preisdaten, leerer Plan");
    if (not cfg.sys.has_solar)
        DisableSolar(res.series);
    MarkHistory(res.series, snap.history, res.now);

    // RiskCompute
    riskfactors_s &rf = res.risk;
    rf = riskfactors_s();
    rf.mode = cfg.sindex.mode;
    daytemps_t temps = FetchDayTemperatures(cfg.sindex, fetch);
    if (cfg.sindex.mode == SINDEX_DYNAMIC)
        rf.margin = CalcLoadMargin(res.series, cfg.sindex, snap.daily, res.today, temps);
    else if (cfg.sindex.mode == SINDEX_PROBABILISTIC)
        rf.margin = CalcProbabilisticMargin(res.series, cfg.sindex, snap.daily, res.today);
    else
        rf.margin.factor = OptNone();
    rf.effective_load_margin = OptOr(rf.margin.factor, cfg.sindex.base_factor);
    rf.effective_load_margin = std::max(0.0f, std::min(cfg.sindex.max_factor, rf.effective_load_margin));
    CalcRiskFactor(res.series, cfg.sindex, res.today, temps, snap.cloud_volatility, snap.temp_volatility, rf);
    float capacity = cfg.sys.has_battery ? cfg.battery.capacity_kwh : 0;
    rf.target_percent = CalcTargetSoc(rf.raw_factor, cfg.battery.min_soc_percent, capacity, cfg.sindex,
                                      rf.target_kwh, rf.target_base_buffer, rf.target_weather_adj);
    WriteLog(LOGINFO, "S-Index %s: Lastzuschlag %.3f, Risikofaktor %.3f, Ziel-SoC %.1f%% (%.2f kWh)",
             ModeName(rf.mode), rf.effective_load_margin, rf.risk_factor, rf.target_percent, rf.target_kwh);

    // ApplyMargins
    ApplySafetyMargins(res.series, cfg, snap.learning, rf.effective_load_margin);

    // IdentifyWindows
    res.initial_soc_kwh = InitialSoc(snap, cfg);
    res.windows = IdentifyWindows(res.series, cfg, res.initial_soc_kwh, res.now);

    // ScheduleWater
    res.water = ScheduleWater(res.series, cfg, snap, res.now);

    // Solve, nur ab now
    size_t first = 0;
    while (first < res.series.size() && res.series[first].hh < res.now)
        first++;
    res.now_index = first;
    if (first >= res.series.size())
    {
        if (res.series.size() > 0)
            WriteLog(LOGWARN, "keine zukünftigen Slots, Optimierer über die ganze Reihe");
        first = 0;
    }
    res.terminal_value = CalcTerminalValue(res.series, first, rf.risk_factor);
    res.target_penalty = rf.target_kwh > 0 ? cfg.sindex.target_penalty[cfg.sindex.risk_appetite - 1] : 0;
    solverinput_s in = BuildSolverInput(res.series, first, res.initial_soc_kwh);
    solverconfig_s sc = BuildSolverConfig(cfg, res.terminal_value, rf.target_kwh, res.target_penalty);
    solverresult_s out;
    if (not RunSolver(solver, in, sc, cfg.solver_timeout, out, err))
    {
        WriteLog(LOGERROR, "Planung abgebrochen: %s", err.c_str());
        return false;
    }
    res.solver_cost = out.total_cost;

    // MergeResult
    MergeSolverResult(res.series, first, out, capacity, res.initial_soc_kwh);

    // ManualOverlay
    res.manual_slots = ApplyManualPlan(res.series, snap.manual, cfg, res.now);

    // DeriveSoCTargets
    ApplySocTargets(res.series, cfg, res.now_index);

    WriteLog(LOGINFO, "Plan %s: %i Slots ab %s, Restwert %.4f, Kosten %.2f", res.solver.c_str(),
             (int)(res.series.size() - std::min(res.now_index, res.series.size())),
             FormatTimestamp(res.now).c_str(), res.terminal_value, res.solver_cost);
    result = res;
    return true;
}
