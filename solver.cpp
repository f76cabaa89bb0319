//
//  solver.cpp
//  planner
//

#include "solver.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <cmath>
#include <stdexcept>

const char *ActionName(int action)
{
    switch (action)
    {
        case ACT_CHARGE: return "Charge";
        case ACT_DISCHARGE: return "Discharge";
        case ACT_EXPORT: return "Export";
        default: return "Hold";
    }
}

int ClassifyAction(float charge_kw, float discharge_kw, float export_kwh)
{
    if (charge_kw > 0.01)
        return ACT_CHARGE;
    if (discharge_kw > 0.01)
        return export_kwh > 0.01 ? ACT_EXPORT : ACT_DISCHARGE;
    return ACT_HOLD;
}

static float SlotHours(time_t start, time_t end)
{
    float h = (end - start) / 3600.0;
    return h > 0 ? h : SLOTHOURS;
}

solverinput_s BuildSolverInput(const slotseries_t &series, size_t first, float initial_soc_kwh)
{
    solverinput_s in;
    in.initial_soc_kwh = initial_soc_kwh;
    for (size_t j = first; j < series.size(); j++)
    {
        const slot_s &s = series[j];
        solverslot_s x;
        x.start = s.hh;
        x.end = s.end;
        x.import_price = s.import_price;
        x.export_price = s.export_price;
        x.pv_kwh = s.adj_pv;
        x.load_kwh = s.adj_load + s.water_kw * SlotHours(s.hh, s.end);
        in.slots.push_back(x);
    }
    return in;
}

solverconfig_s BuildSolverConfig(const planner_config_t &cfg, float terminal_value, float target_soc_kwh,
                                 float target_penalty)
{
    solverconfig_s sc;
    sc.capacity_kwh = cfg.sys.has_battery ? cfg.battery.capacity_kwh : 0;
    sc.min_soc_percent = cfg.battery.min_soc_percent;
    sc.max_soc_percent = cfg.battery.max_soc_percent;
    sc.max_charge_kw = cfg.sys.has_battery ? cfg.battery.max_charge_kw : 0;
    sc.max_discharge_kw = cfg.sys.has_battery ? cfg.battery.max_discharge_kw : 0;
    sc.charge_eff = cfg.battery.charge_eff;
    sc.discharge_eff = cfg.battery.discharge_eff;
    sc.cycle_cost = cfg.economics.cycle_cost;
    sc.ramping_cost = cfg.economics.ramping_cost;
    sc.export_threshold = cfg.economics.export_threshold;
    sc.terminal_value = terminal_value;
    sc.target_soc_kwh = target_soc_kwh;
    sc.target_penalty = target_soc_kwh > 0 ? target_penalty : 0;
    sc.enable_export = cfg.economics.enable_export;
    return sc;
}

typedef struct {
    solverinput_s in;
    solverconfig_s cfg;
    solverresult_s out;
    std::string err;
} solvejob_s;

bool RunSolver(std::shared_ptr<DispatchSolver> solver, const solverinput_s &in, const solverconfig_s &cfg,
               int timeout, solverresult_s &out, std::string &err)
{
    if (not solver)
    {
        err = "no solver configured";
        return false;
    }
    // Auftrag gehört dem Thread, bleibt bei Zeitüberschreitung gültig
    std::shared_ptr<solvejob_s> job = std::make_shared<solvejob_s>();
    solver->ClearCancel();
    job->in = in;
    job->cfg = cfg;
    std::packaged_task<bool()> task([solver, job]()
    {
        return solver->Solve(job->in, job->cfg, job->out, job->err);
    });
    std::future<bool> result = task.get_future();
    std::thread worker(std::move(task));
    worker.detach();

    WriteLog(LOGDEBUG, "Solver %s: %i Slots, Start-SoC %.2f kWh", solver->Name(), (int)in.slots.size(), in.initial_soc_kwh);
    if (result.wait_for(std::chrono::seconds(timeout)) != std::future_status::ready)
    {
        err = std::string("solver ") + solver->Name() + " timed out";
        solver->Cancel();
        if (result.wait_for(std::chrono::seconds(SOLVERGRACE)) != std::future_status::ready)
            WriteLog(LOGWARN, "Solver %s reagiert nicht auf Abbruch", solver->Name());
        return false;
    }
    bool ok;
    try
    {
        ok = result.get();
    }
    catch (const std::exception &e)
    {
        err = std::string("solver failed: ") + e.what();
        return false;
    }
    if (not ok)
    {
        err = std::string("solver failed: ") + job->err;
        return false;
    }
    out = job->out;
    return ValidateSolverResult(in, out, err);
}

bool ValidateSolverResult(const solverinput_s &in, const solverresult_s &out, std::string &err)
{
    if (out.slots.size() != in.slots.size())
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "solver returned %i slots, expected %i", (int)out.slots.size(), (int)in.slots.size());
        err = buf;
        return false;
    }
    for (size_t k = 0; k < out.slots.size(); k++)
    {
        const solverslotresult_s &r = out.slots[k];
        if (r.start != in.slots[k].start)
        {
            err = "solver result out of order at " + FormatTimestamp(in.slots[k].start);
            return false;
        }
        if (not (std::isfinite(r.charge_kw) && std::isfinite(r.discharge_kw) && std::isfinite(r.import_kwh)
                 && std::isfinite(r.export_kwh) && std::isfinite(r.soc_kwh)))
        {
            err = "solver result not numeric at " + FormatTimestamp(in.slots[k].start);
            return false;
        }
    }
    return true;
}

void MergeSolverResult(slotseries_t &series, size_t first, const solverresult_s &res, float capacity_kwh,
                       float initial_soc_kwh)
{
    float prev = initial_soc_kwh;
    for (size_t k = 0; k < res.slots.size() && first + k < series.size(); k++)
    {
        slot_s &s = series[first + k];
        const solverslotresult_s &r = res.slots[k];
        s.charge_kw = r.charge_kw;
        s.discharge_kw = r.discharge_kw;
        s.import_kwh = r.import_kwh;
        s.export_kwh = r.export_kwh;
        s.soc_kwh = r.soc_kwh;
        s.soc_percent = capacity_kwh > 0 ? r.soc_kwh / capacity_kwh * 100 : 0;
        s.action = ClassifyAction(r.charge_kw, r.discharge_kw, r.export_kwh);
        s.entry_soc = OptVal(capacity_kwh > 0 ? prev / capacity_kwh * 100 : 0);
        prev = r.soc_kwh;
        SplitWater(s);
    }
}

void SplitWater(slot_s &s)
{
    float h = SlotHours(s.hh, s.end);
    float water = s.water_kw * h;
    s.water_pv_kwh = s.water_batt_kwh = s.water_grid_kwh = 0;
    if (water <= 0)
        return;
    // erst PV-Überschuss, dann Batterie, Rest Netz
    float pv_surplus = std::max(0.0f, s.adj_pv - s.adj_load);
    s.water_pv_kwh = std::min(water, pv_surplus);
    float rest = water - s.water_pv_kwh;
    float base = std::max(0.0f, s.adj_load - s.adj_pv);
    float batt = std::max(0.0f, s.discharge_kw * h - base);
    s.water_batt_kwh = std::min(rest, batt);
    s.water_grid_kwh = rest - s.water_batt_kwh;
}
