//
//  solver.hpp
//  planner
//
//  Schnittstelle zum Optimierer für Laden/Entladen/Einspeisen
//

#ifndef solver_hpp
#define solver_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

typedef struct {
    time_t start, end;
    float import_price, export_price;
    float pv_kwh;
    float load_kwh;             // angepasste Last + Warmwasser
} solverslot_s;

typedef struct {
    std::vector<solverslot_s> slots;
    float initial_soc_kwh;
} solverinput_s;

typedef struct {
    float capacity_kwh;
    float min_soc_percent, max_soc_percent;
    float max_charge_kw, max_discharge_kw;
    float charge_eff, discharge_eff;
    float cycle_cost;           // Verschleiß je kWh
    float ramping_cost;
    float export_threshold;
    float terminal_value;       // Wert je kWh am Horizontende
    float target_soc_kwh;       // 0 = kein Ziel
    float target_penalty;
    bool enable_export;
} solverconfig_s;

typedef struct {
    time_t start;
    float charge_kw, discharge_kw;
    float import_kwh, export_kwh;
    float soc_kwh;
    int action;                 // action_e
    float cost;
} solverslotresult_s;

typedef struct {
    std::vector<solverslotresult_s> slots;
    float total_cost;
} solverresult_s;

class DispatchSolver
{
public:
    DispatchSolver() : cancelled(false) {}
    virtual ~DispatchSolver() {}
    virtual const char *Name() const = 0;
    virtual bool Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err) = 0;

    // von RunSolver nach Zeitüberschreitung gesetzt, Solve soll dann zurückkehren
    void Cancel() { cancelled = true; }
    void ClearCancel() { cancelled = false; }
    bool Cancelled() const { return cancelled; }

private:
    std::atomic<bool> cancelled;
};

int ClassifyAction(float charge_kw, float discharge_kw, float export_kwh);

solverinput_s BuildSolverInput(const slotseries_t &series, size_t first, float initial_soc_kwh);
solverconfig_s BuildSolverConfig(const planner_config_t &cfg, float terminal_value, float target_soc_kwh,
                                 float target_penalty);

// Optimierer in eigenem Thread, nach timeout Sekunden Cancel() und bis SOLVERGRACE warten
bool RunSolver(std::shared_ptr<DispatchSolver> solver, const solverinput_s &in, const solverconfig_s &cfg,
               int timeout, solverresult_s &out, std::string &err);

bool ValidateSolverResult(const solverinput_s &in, const solverresult_s &out, std::string &err);

// Ergebnis ab Slot first übernehmen, Warmwasser auf PV/Batterie/Netz aufteilen
void MergeSolverResult(slotseries_t &series, size_t first, const solverresult_s &res, float capacity_kwh,
                       float initial_soc_kwh);

// Warmwasserenergie des Slots auf PV, Batterie und Netz verteilen
void SplitWater(slot_s &s);

#endif /* solver_hpp */
