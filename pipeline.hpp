//
//  pipeline.hpp
//  planner
//
//  Ein Planungslauf: Daten aufbereiten, Risiko, Ladefenster, Warmwasser,
//  Optimierer, manuelle Planung, Ziel-SoC
//

#ifndef pipeline_hpp
#define pipeline_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include "sindex.hpp"
#include "solver.hpp"
#include <memory>
#include <string>
#include <vector>

typedef struct {
    planner_config_t cfg;           // wirksame Konfiguration inkl. Overrides
    time_t now;                     // auf 15min abgerundet
    int today;
    slotseries_t series;
    size_t now_index;               // erster Slot ab now
    riskfactors_s risk;
    windowresult_s windows;
    waterresult_s water;
    float initial_soc_kwh;
    float terminal_value;
    float target_penalty;
    int manual_slots;
    std::string solver;
    float solver_cost;
} planresult_s;

// fetch leer: Temperaturen aus Snapshot bzw. open-meteo
// solver leer: GreedySolver
// result wird nur bei Erfolg überschrieben
bool RunPipeline(const snapshot_s &snap, const planner_config_t &base, const std::vector<std::string> &overrides,
                 std::shared_ptr<DispatchSolver> solver, tempfetch_t fetch, planresult_s &result, std::string &err);

#endif /* pipeline_hpp */
