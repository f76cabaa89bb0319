//
//  waterheating.hpp
//  planner
//
//  Warmwasserbereitung in günstige Blöcke legen
//

#ifndef waterheating_hpp
#define waterheating_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <vector>

// cand: Slotindizes zeitlich sortiert; Ergebnis nach Durchschnittspreis, dann Beginn
std::vector<watersegment_s> BuildWaterSegments(const slotseries_t &series, const std::vector<int> &cand,
                                               int max_gap_slots, float tolerance);

std::vector<int> SelectWaterSlots(const slotseries_t &series, const std::vector<int> &cand, int needed,
                                  int max_gap_slots, float tolerance);

// zusammenhängende Läufe bilden und bis max_blocks zusammenlegen
// avail[j]: Slot j darf zum Überbrücken belegt werden
std::vector<std::vector<int> > ConsolidateWaterBlocks(const slotseries_t &series, const std::vector<int> &selected,
                                                      int max_blocks, const std::vector<bool> &avail);

bool HasFullPriceDay(const slotseries_t &series, int day);

waterresult_s ScheduleWater(slotseries_t &series, const planner_config_t &cfg, const snapshot_s &snap, time_t now);

#endif /* waterheating_hpp */
