//
//  soctarget.hpp
//  planner
//
//  Restwert am Horizontende und Ziel-SoC je Slot für den Wechselrichter
//

#ifndef soctarget_hpp
#define soctarget_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <vector>

// mittlerer Bezugspreis ab first * risk_factor
float CalcTerminalValue(const slotseries_t &series, size_t first, float risk_factor);

// Indizes mit Abstand <= max_gap zu Blöcken zusammenfassen
std::vector<std::vector<int> > GroupBlocks(const std::vector<int> &indices, int max_gap);

// now_index: erster Slot ab now, series.size() wenn alle Slots vergangen
void ApplySocTargets(slotseries_t &series, const planner_config_t &cfg, size_t now_index);

#endif /* soctarget_hpp */
