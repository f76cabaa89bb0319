//
//  windows.hpp
//  planner
//

#ifndef windows_hpp
#define windows_hpp

#include "plannertypes.hpp"
#include "plannerconfig.hpp"
#include <vector>

// Perzentil mit linearer Interpolation, pct 0..100
float Percentile(std::vector<float> values, float pct);

// günstige Slots markieren, Schwelle bei Bedarf anheben
windowresult_s IdentifyWindows(slotseries_t &series, const planner_config_t &cfg, float current_kwh, time_t now);

#endif /* windows_hpp */
