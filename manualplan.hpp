//
//  manualplan.hpp
//  planner
//

#ifndef manualplan_hpp
#define manualplan_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <vector>

// Aktion aus action/content/title, sonst aus id oder group
int InferManualAction(const manualentry_s &entry);

// nur Slots ab now, letzter Eintrag gewinnt; Rückgabe: belegte Slots
int ApplyManualPlan(slotseries_t &series, const std::vector<manualentry_s> &plan, const planner_config_t &cfg,
                    time_t now);

#endif /* manualplan_hpp */
