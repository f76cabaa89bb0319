//
//  schedule.hpp
//  planner
//
//  Ausgabe: schedule.json für den Executor und Debug-Daten
//

#ifndef schedule_hpp
#define schedule_hpp

#include "pipeline.hpp"
#include "cJSON.h"
#include <string>

// Begründung und Priorität eines Slots für die Anzeige
const char *SlotReason(const slot_s &s, const char *&priority);

// Importkosten minus Einspeiseerlös
float PlannedCost(const slot_s &s);

cJSON *SlotToJson(const slot_s &s, int slot_number);
cJSON *ScheduleToJson(const planresult_s &res);
cJSON *DebugToJson(const planresult_s &res, int sample_size);

// über Temporärdatei und rename, bei Fehler bleibt die alte Datei stehen
bool WriteJsonFile(const char *fname, const cJSON *json, std::string &err);

bool WriteSchedule(const char *fname, const planresult_s &res, std::string &err);
bool WriteDebug(const char *fname, const planresult_s &res, std::string &err);

#endif /* schedule_hpp */
