//
//  Planner_CONF.h
//  planner
//
#define VERSION "P2024.11.02.0" // Planer für dynamische Tarife, Speicher und Warmwasser
#ifndef Planner_CONF_h
#define Planner_CONF_h

// Konfigurationsdatei
#define CONF_FILE "planner.config.txt"
#define SCHEDULE_FILE "schedule.json"
#define DEBUG_FILE "planner.debug.json"
#define LOG_FILE "planner.log"
#define TIMEZONE "Europe/Stockholm"

#define SLOTSECONDS 900          // 15min Raster
#define SLOTHOURS 0.25

// battery
#define CAPACITY_KWH 0.0         // muss in der Konfiguration gesetzt werden
#define MINSOC 10.0              // Prozent
#define MAXSOC 100.0
#define MAXCHARGEKW 5.0
#define MAXDISCHARGEKW 5.0
#define EFFICIENCY 0.95

// s_index
#define BASEFACTOR 1.05
#define MAXFACTOR 1.5
#define MINFACTOR 0.8
#define PVDEFICITWEIGHT 0.2
#define TEMPBASELINE 20.0        // °C, ab hier kein Zuschlag
#define TEMPCOLD -15.0           // °C, voller Zuschlag
#define SINDEXDAYS 4
#define RISKAPPETITE 3           // 1 = Sicherheit ... 5 = Spieler
#define WEATHERSCALE 40.0        // Prozentpunkte je 1.0 Faktor
#define WEATHERCAP 8.0           // max. Wetterzuschlag in Prozentpunkten
#define TARGETFLOOR 5.0          // absolutes Minimum Ziel-SoC
#define WEATHERAMPLIFICATION 0.4 // max. Verstärkung durch Wettervolatilität

// forecasting / charging
#define PVCONFIDENCE 90.0
#define CHARGEPERCENTILE 15.0
#define CHEAPTOLERANCE 0.10
#define PRICESMOOTHING 0.05
#define EXPANSIONSTEP 0.0001

// water_heating
#define WATERPOWERKW 3.0
#define WATERMINHOURS 2.0
#define WATERMAXBLOCKS 2
#define ALINTERVALDAYS 7
#define ALDURATIONHOURS 3.0
#define ALEARLIESTHOUR 14        // Preise für morgen sind ab 14:00 bekannt

// solver
#define SOLVERTIMEOUT 30         // Sekunden
#define SOLVERGRACE 2            // Sekunden nach Abbruch bis zur Rückkehr

#endif /* Planner_CONF_h */
