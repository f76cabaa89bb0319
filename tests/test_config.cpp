//
//  test_config.cpp
//  planner
//

#include "testhelper.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdio.h>
#include <unistd.h>

static const char *CONFFILE = "test_planner.config.txt";

static void WriteFile(const char *fname, const char *text)
{
    FILE *fp = fopen(fname, "w");
    assert(fp != NULL);
    fputs(text, fp);
    fclose(fp);
}

bool test_read_config_file() {
    std::cout << "Testing config file sections and keys..." << std::flush;
    WriteFile(CONFFILE,
              "# Anlage\n"
              "[system]\n"
              "timezone = Europe/Stockholm\n"
              "has_water_heater = false   # kein Boiler\n"
              "\n"
              "[battery]\n"
              "capacity_kwh = 13.5\n"
              "min_soc_percent=15\n"
              "max_charge_power_kw = 6\n"
              "\n"
              "[battery_economics]\n"
              "battery_cycle_cost_kwh = 0.25\n"
              "\n"
              "[s_index]\n"
              "mode = probabilistic\n"
              "risk_appetite = 2\n"
              "base_buffer = 40, 25, 12, 4, -5\n"
              "\n"
              "[strategic_charging]\n"
              "target_soc_percent = 85\n");
    planner_config_t cfg;
    DefaultConfig(cfg);
    std::string err;
    assert(GetConfig(CONFFILE, cfg, err));
    assert(strcmp(cfg.sys.timezone, "Europe/Stockholm") == 0);
    assert(not cfg.sys.has_water_heater);
    assert(cfg.battery.present && cfg.economics.present);
    assert(std::fabs(cfg.battery.capacity_kwh - 13.5) < 1e-5);
    assert(cfg.battery.min_soc_percent == 15);
    assert(cfg.battery.max_charge_kw == 6);
    assert(std::fabs(cfg.economics.cycle_cost - 0.25) < 1e-5);
    assert(cfg.sindex.mode == SINDEX_PROBABILISTIC);
    assert(cfg.sindex.risk_appetite == 2);
    assert(cfg.sindex.base_buffer[0] == 40 && cfg.sindex.base_buffer[4] == -5);
    assert(cfg.charging.strategic_target.set && cfg.charging.strategic_target.val == 85);
    // nicht gesetzte Werte bleiben Vorgabe
    assert(cfg.battery.max_soc_percent == MAXSOC);
    assert(not WaterEnabled(cfg));
    assert(ValidateConfig(cfg, err));
    unlink(CONFFILE);
    std::cout << " PASS\n";
    return true;
}

bool test_config_errors() {
    std::cout << "Testing config errors..." << std::flush;
    planner_config_t cfg;
    std::string err;

    DefaultConfig(cfg);
    assert(not GetConfig("does_not_exist.txt", cfg, err));
    assert(err.find("does_not_exist.txt") != std::string::npos);

    // battery fehlt
    WriteFile(CONFFILE, "[battery_economics]\nbattery_cycle_cost_kwh = 0.1\n");
    DefaultConfig(cfg);
    assert(GetConfig(CONFFILE, cfg, err));
    assert(not ValidateConfig(cfg, err));
    assert(err.find("battery") != std::string::npos);

    // ungültiger Wert mit Zeilennummer
    WriteFile(CONFFILE, "[battery]\ncapacity_kwh = viel\n");
    DefaultConfig(cfg);
    err.clear();
    assert(not GetConfig(CONFFILE, cfg, err));
    assert(err.find("battery.capacity_kwh") != std::string::npos);
    assert(err.find(":2") != std::string::npos);

    // unbekannte Einträge sind nur eine Warnung
    WriteFile(CONFFILE, "[battery]\nfarbe = blau\n[unbekannt]\nx = 1\n");
    DefaultConfig(cfg);
    assert(GetConfig(CONFFILE, cfg, err));
    unlink(CONFFILE);
    std::cout << " PASS\n";
    return true;
}

bool test_overrides() {
    std::cout << "Testing section.key=value overrides..." << std::flush;
    planner_config_t base = TestConfig();
    planner_config_t cfg;
    std::string err;
    std::vector<std::string> ov;
    ov.push_back("s_index.risk_appetite=5");
    ov.push_back("water_heating.min_kwh_per_day = 4.5");
    ov.push_back("manual_planning.export_target_percent=none");
    assert(ApplyOverrides(base, ov, cfg, err));
    assert(cfg.sindex.risk_appetite == 5);
    assert(cfg.water.min_kwh.set && std::fabs(WaterMinKwh(cfg) - 4.5) < 1e-5);
    assert(not cfg.charging.manual_export_target.set);
    // Basis bleibt unverändert
    assert(base.sindex.risk_appetite == RISKAPPETITE);

    // fehlerhafte Liste: Ausgabe unberührt
    planner_config_t untouched = TestConfig();
    cfg = untouched;
    ov.push_back("battery.capacity_kwh");
    assert(not ApplyOverrides(base, ov, cfg, err));
    assert(cfg.sindex.risk_appetite == untouched.sindex.risk_appetite);

    ov.clear();
    ov.push_back("s_index.mode=sometimes");
    assert(not ApplyOverrides(base, ov, cfg, err));
    assert(err.find("s_index.mode") != std::string::npos);

    WriteFile(CONFFILE, "# overrides\ncharging_strategy.cheap_price_tolerance=0.2\n\nsolver.timeout_seconds=5\n");
    ov.clear();
    assert(ReadOverrideFile(CONFFILE, ov, err));
    assert(ov.size() == 2);
    assert(ApplyOverrides(base, ov, cfg, err));
    assert(std::fabs(cfg.charging.tolerance - 0.2) < 1e-5);
    assert(cfg.solver_timeout == 5);
    unlink(CONFFILE);
    std::cout << " PASS\n";
    return true;
}

bool test_validate_config() {
    std::cout << "Testing config validation..." << std::flush;
    std::string err;
    planner_config_t cfg = TestConfig();
    assert(ValidateConfig(cfg, err));

    cfg.battery.capacity_kwh = 0;
    assert(not ValidateConfig(cfg, err));
    // ohne Akku ist die Kapazität egal
    cfg.sys.has_battery = false;
    assert(ValidateConfig(cfg, err));

    cfg = TestConfig();
    cfg.battery.max_soc_percent = 5;
    assert(not ValidateConfig(cfg, err));

    cfg = TestConfig();
    cfg.sindex.risk_appetite = 6;
    assert(not ValidateConfig(cfg, err));

    cfg = TestConfig();
    cfg.sindex.base_buffer[2] = 50;
    assert(not ValidateConfig(cfg, err));

    cfg = TestConfig();
    cfg.solver_timeout = 0;
    assert(not ValidateConfig(cfg, err));

    cfg = TestConfig();
    cfg.economics.present = false;
    assert(not ValidateConfig(cfg, err));
    assert(err.find("battery_economics") != std::string::npos);

    // Tippfehler in der Zeitzone ist ein Fehler, kein stilles UTC
    cfg = TestConfig();
    strcpy(cfg.sys.timezone, "Europe/Stokholm");
    assert(not ValidateConfig(cfg, err));
    assert(err.find("Europe/Stokholm") != std::string::npos);
    strcpy(cfg.sys.timezone, "../../etc/passwd");
    assert(not ValidateConfig(cfg, err));
    strcpy(cfg.sys.timezone, "Europe/Stockholm");
    assert(ValidateConfig(cfg, err));
    assert(ApplyOverride(cfg, "system.timezone=Mars/Olympus", err));
    assert(not ValidateConfig(cfg, err));
    std::cout << " PASS\n";
    return true;
}

bool test_water_fallbacks() {
    std::cout << "Testing water settings fall back to charging strategy..." << std::flush;
    planner_config_t cfg = TestConfig();
    std::string err;
    assert(std::fabs(WaterMinKwh(cfg) - WATERPOWERKW * WATERMINHOURS) < 1e-5);
    cfg.charging.consolidation_tolerance = 0.3f;
    cfg.charging.max_gap_slots = 2;
    assert(std::fabs(WaterTolerance(cfg) - 0.3) < 1e-5);
    assert(WaterMaxGap(cfg) == 2);
    cfg.water.consolidation_tolerance = OptVal(0.1);
    cfg.water.max_gap_slots = 0;
    assert(std::fabs(WaterTolerance(cfg) - 0.1) < 1e-5);
    assert(WaterMaxGap(cfg) == 0);

    // nur heute oder morgen
    assert(ApplyOverride(cfg, "water_heating.plan_days_ahead=3", err));
    assert(cfg.water.plan_days_ahead == 1);
    assert(ApplyOverride(cfg, "water_heating.plan_days_ahead=-2", err));
    assert(cfg.water.plan_days_ahead == 0);

    cfg.water.power_kw = 0;
    assert(not WaterEnabled(cfg));
    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "CONFIG TESTS\n";
    std::cout << "============================================================================\n\n";
    TestInit();

    bool all_passed = true;
    all_passed &= test_read_config_file();
    all_passed &= test_config_errors();
    all_passed &= test_overrides();
    all_passed &= test_validate_config();
    all_passed &= test_water_fallbacks();

    std::cout << "\n============================================================================\n";
    if (not all_passed)
    {
        std::cout << "Some tests FAILED\n";
        return 1;
    }
    std::cout << "All config tests PASSED\n";
    return 0;
}
