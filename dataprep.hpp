//
//  dataprep.hpp
//  planner
//

#ifndef dataprep_hpp
#define dataprep_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"

slot_s NewSlot(time_t hh, time_t end);

// Preise und Prognosen zu einer 15min Slotreihe zusammenführen
void PrepareSlots(const snapshot_s &snap, slotseries_t &series);

void DisableSolar(slotseries_t &series);

// PV-Vertrauen, Lastzuschlag und Lernkorrektur je Stunde
void ApplySafetyMargins(slotseries_t &series, const planner_config_t &cfg, const learning_s &overlay, float load_margin);

// Slots vor now einfrieren, Start-SoC aus der Historie
void MarkHistory(slotseries_t &series, const std::vector<historyrec_s> &history, time_t now);

#endif /* dataprep_hpp */
