//
//  snapshot.hpp
//  planner
//
//  Eingangsdaten (Preise, Prognosen, Batteriezustand) als JSON
//

#ifndef snapshot_hpp
#define snapshot_hpp

#include "plannertypes.hpp"
#include <string>

void ClearSnapshot(snapshot_s &snap);

// Zeitzone muss vorher gesetzt sein, lokale Zeitangaben werden damit umgerechnet
bool ParseSnapshot(const char *json, snapshot_s &snap, std::string &err);
bool ReadSnapshot(const char *fname, snapshot_s &snap, std::string &err);

bool ReadTextFile(const char *fname, std::string &text);

#endif /* snapshot_hpp */
