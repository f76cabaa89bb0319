//
//  test_pipeline.cpp
//  planner
//

#include "testhelper.hpp"
#include "pipeline.hpp"
#include "schedule.hpp"
#include "snapshot.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <unistd.h>
#include <stdlib.h>

class BrokenSolver : public DispatchSolver
{
public:
    const char *Name() const { return "broken"; }
    bool Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err)
    {
        err = "no feasible plan";
        return false;
    }
};

static std::map<int, float> NoTemperatures(const std::vector<int> &offsets)
{
    return std::map<int, float>();
}

// zwei Tage: nachts billig, abends teuer, mittags PV
static snapshot_s TwoDays()
{
    time_t t0 = TestDay0();
    snapshot_s snap;
    ClearSnapshot(snap);
    snap.now = t0 + 10 * 3600 + 300;
    for (int j = 0; j < 192; j++)
    {
        int hour = (j / 4) % 24;
        float price = 1.5;
        if (hour < 6)
            price = 0.5;
        else if (hour >= 17 && hour < 22)
            price = 3.0;
        pricerec_s p;
        p.start = t0 + j * SLOTSECONDS;
        p.end = p.start + SLOTSECONDS;
        p.import_price = OptVal(price);
        p.export_price = OptVal(price * 0.8);
        snap.prices.push_back(p);

        forecastrec_s f;
        f.start = p.start;
        f.pv = OptVal(hour >= 9 && hour < 16 ? 0.4 : 0);
        f.load = OptVal(0.3);
        f.pv_p10 = f.pv_p90 = f.load_p10 = f.load_p90 = OptNone();
        snap.forecasts.push_back(f);
    }
    int today = LocalDay(t0);
    for (int d = 0; d < 4; d++)
    {
        snap.daily.pv[today + d] = 11.2 - 2 * d;
        snap.daily.load[today + d] = 28.8;
    }
    historyrec_s h;
    h.start = t0;
    h.soc_percent = OptVal(60);
    snap.history.push_back(h);
    snap.battery_soc_percent = OptVal(50);

    manualentry_s m;
    m.id = "manual-1";
    m.action = "Charge";
    m.start = t0 + 20 * 3600;
    m.end = t0 + 21 * 3600;
    snap.manual.push_back(m);
    return snap;
}

static std::string ScheduleText(const planresult_s &res)
{
    cJSON *root = ScheduleToJson(res);
    char *text = cJSON_PrintUnformatted(root);
    std::string s = text;
    cJSON_free(text);
    cJSON_Delete(root);
    return s;
}

bool test_full_run() {
    std::cout << "Testing full planning run..." << std::flush;
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    planresult_s res;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       res, err));
    time_t t0 = TestDay0();
    assert(res.now == t0 + 10 * 3600);
    assert(res.series.size() == 192);
    assert(res.now_index == 40);
    assert(res.series[res.now_index].hh == res.now);
    assert(res.solver == "greedy");
    assert(std::fabs(res.initial_soc_kwh - 5.0) < 1e-4);

    for (size_t j = 0; j < res.series.size(); j++)
    {
        const slot_s &s = res.series[j];
        assert(s.historical == (j < 40));
        assert(s.soc_target >= 0 && s.soc_target <= cfg.battery.max_soc_percent);
        if (j < 40)
        {
            // Vergangenheit wird nicht geplant
            assert(s.charge_kw == 0 && s.discharge_kw == 0 && s.water_kw == 0);
            continue;
        }
        assert(s.soc_kwh >= -1e-4 && s.soc_kwh <= cfg.battery.capacity_kwh + 1e-4);
        assert(s.entry_soc.set);
    }
    assert(res.series[0].soc_target == 60);
    assert(res.series[1].soc_target == cfg.battery.min_soc_percent);

    // manuelles Laden 20-21 Uhr
    assert(res.manual_slots == 4);
    for (int j = 80; j < 84; j++)
        assert(res.series[j].manual == MAN_CHARGE && res.series[j].action == ACT_CHARGE);
    // ein Sollwert für den ganzen manuellen Block
    assert(res.series[80].soc_target == res.series[83].soc_target);

    assert(res.water.enabled);
    assert(res.water.days.size() >= 1);
    assert(res.risk.effective_load_margin > 0 && res.risk.effective_load_margin <= cfg.sindex.max_factor);
    assert(res.risk.target_percent >= cfg.sindex.target_floor);
    assert(res.terminal_value > 0);
    std::cout << " PASS\n";
    return true;
}

bool test_deterministic_output() {
    std::cout << "Testing identical input gives identical schedule..." << std::flush;
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    planresult_s a, b;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       a, err));
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       b, err));
    std::string ta = ScheduleText(a);
    assert(ta == ScheduleText(b));
    assert(ta.find("\"planner_version\":\"" VERSION "\"") != std::string::npos);
    std::cout << " PASS\n";
    return true;
}

bool test_overrides_and_learning() {
    std::cout << "Testing run overrides and learned base factor..." << std::flush;
    snapshot_s snap = TwoDays();
    snap.learning.base_factor = OptVal(1.2);
    planner_config_t cfg = TestConfig();
    cfg.sindex.mode = SINDEX_STATIC;
    std::vector<std::string> ov;
    ov.push_back("s_index.risk_appetite=1");
    planresult_s res;
    std::string err;
    assert(RunPipeline(snap, cfg, ov, std::shared_ptr<DispatchSolver>(), NoTemperatures, res, err));
    assert(res.cfg.sindex.risk_appetite == 1);
    assert(cfg.sindex.risk_appetite == RISKAPPETITE);
    assert(std::fabs(res.risk.effective_load_margin - 1.2) < 1e-5);
    assert(std::fabs(res.series[50].adj_load - 0.3 * 1.2) < 1e-5);

    // Lernen aus: Basisfaktor der Konfiguration
    ov.push_back("learning.enable=false");
    assert(RunPipeline(snap, cfg, ov, std::shared_ptr<DispatchSolver>(), NoTemperatures, res, err));
    assert(std::fabs(res.risk.effective_load_margin - BASEFACTOR) < 1e-5);

    ov.push_back("s_index.risk_appetite=9");
    assert(not RunPipeline(snap, cfg, ov, std::shared_ptr<DispatchSolver>(), NoTemperatures, res, err));
    assert(err.find("risk_appetite") != std::string::npos);
    std::cout << " PASS\n";
    return true;
}

bool test_timezone_override_is_per_run() {
    std::cout << "Testing timezone override does not leak into later runs..." << std::flush;
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    planresult_s first, shifted, again;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       first, err));
    std::vector<std::string> ov(1, "system.timezone=Pacific/Kiritimati");
    assert(RunPipeline(snap, cfg, ov, std::shared_ptr<DispatchSolver>(), NoTemperatures, shifted, err));
    // UTC+14: 10:00 UTC ist dort schon der nächste Tag
    assert(shifted.today == first.today + 1);
    assert(strcmp(getenv("TZ"), "UTC") == 0);

    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       again, err));
    assert(again.today == first.today);
    assert(ScheduleText(again) == ScheduleText(first));
    assert(strcmp(getenv("TZ"), "UTC") == 0);

    // unbekannte Zeitzone bricht den Lauf ab
    ov[0] = "system.timezone=Europe/Stokholm";
    assert(not RunPipeline(snap, cfg, ov, std::shared_ptr<DispatchSolver>(), NoTemperatures, shifted, err));
    assert(err.find("timezone") != std::string::npos);
    assert(strcmp(getenv("TZ"), "UTC") == 0);
    std::cout << " PASS\n";
    return true;
}

bool test_temperatures_fetched_once() {
    std::cout << "Testing temperatures fetched once per run..." << std::flush;
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    cfg.sindex.temp_weight = 0.1;
    int calls = 0;
    std::vector<int> asked;
    tempfetch_t fetch = [&calls, &asked](const std::vector<int> &offsets) -> std::map<int, float>
    {
        calls++;
        asked = offsets;
        std::map<int, float> t;
        for (size_t k = 0; k < offsets.size(); k++)
            t[offsets[k]] = -5;
        return t;
    };
    planresult_s res;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), fetch, res, err));
    assert(calls == 1);
    assert((int)asked.size() == cfg.sindex.horizon_days && asked.front() == 1);
    assert(res.risk.margin.temp_adjustment.set);
    assert(res.risk.d2_temperature.set && res.risk.d2_temperature.val == -5);

    cfg.sindex.temp_weight = 0;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), fetch, res, err));
    assert(calls == 1);
    std::cout << " PASS\n";
    return true;
}

bool test_failure_keeps_result() {
    std::cout << "Testing failed run leaves previous result..." << std::flush;
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    planresult_s res;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       res, err));
    std::string before = ScheduleText(res);

    std::shared_ptr<DispatchSolver> broken = std::make_shared<BrokenSolver>();
    assert(not RunPipeline(snap, cfg, std::vector<std::string>(), broken, NoTemperatures, res, err));
    assert(err.find("no feasible plan") != std::string::npos);
    assert(ScheduleText(res) == before);

    // ohne battery-Abschnitt
    planner_config_t nobatt = TestConfig();
    nobatt.battery.present = false;
    assert(not RunPipeline(snap, nobatt, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(),
                           NoTemperatures, res, err));
    assert(ScheduleText(res) == before);
    std::cout << " PASS\n";
    return true;
}

bool test_edge_horizons() {
    std::cout << "Testing empty prices and fully past horizon..." << std::flush;
    planner_config_t cfg = TestConfig();
    planresult_s res;
    std::string err;

    snapshot_s empty;
    ClearSnapshot(empty);
    empty.now = TestDay0();
    assert(RunPipeline(empty, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       res, err));
    assert(res.series.size() == 0);

    snapshot_s past = TwoDays();
    past.now = TestDay0() + 3 * 86400;
    assert(RunPipeline(past, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       res, err));
    assert(res.now_index == res.series.size());
    assert(res.manual_slots == 0);
    std::cout << " PASS\n";
    return true;
}

bool test_write_schedule_file() {
    std::cout << "Testing schedule file output..." << std::flush;
    const char *fname = "test_schedule.json";
    snapshot_s snap = TwoDays();
    planner_config_t cfg = TestConfig();
    planresult_s res;
    std::string err;
    assert(RunPipeline(snap, cfg, std::vector<std::string>(), std::shared_ptr<DispatchSolver>(), NoTemperatures,
                       res, err));
    assert(WriteSchedule(fname, res, err));
    assert(access("test_schedule.json.tmp", F_OK) != 0);

    std::string text;
    assert(ReadTextFile(fname, text));
    cJSON *root = cJSON_Parse(text.c_str());
    assert(root != NULL);
    const cJSON *arr = cJSON_GetObjectItemCaseSensitive(root, "schedule");
    assert(cJSON_IsArray(arr) && cJSON_GetArraySize(arr) == 192);
    const cJSON *first = cJSON_GetArrayItem(arr, 0);
    assert(cJSON_GetObjectItemCaseSensitive(first, "slot_number")->valueint == 1);
    assert(cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(first, "is_historical")));
    const cJSON *manual = cJSON_GetObjectItemCaseSensitive(cJSON_GetArrayItem(arr, 80), "manual_action");
    assert(cJSON_IsString(manual) && strcmp(manual->valuestring, "Charge") == 0);
    const cJSON *meta = cJSON_GetObjectItemCaseSensitive(root, "meta");
    assert(strcmp(cJSON_GetObjectItemCaseSensitive(meta, "solver")->valuestring, "greedy") == 0);
    cJSON_Delete(root);

    cJSON *debug = DebugToJson(res, 30);
    assert(cJSON_GetArraySize(cJSON_GetObjectItemCaseSensitive(debug, "sample_schedule")) == 30);
    assert(cJSON_GetObjectItemCaseSensitive(debug, "water_analysis") != NULL);
    cJSON_Delete(debug);

    // Verzeichnis fehlt: Fehler, nichts geschrieben
    assert(not WriteSchedule("no_such_dir/schedule.json", res, err));
    unlink(fname);
    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "PIPELINE TESTS\n";
    std::cout << "============================================================================\n\n";
    TestInit();

    bool all_passed = true;
    all_passed &= test_full_run();
    all_passed &= test_deterministic_output();
    all_passed &= test_overrides_and_learning();
    all_passed &= test_timezone_override_is_per_run();
    all_passed &= test_temperatures_fetched_once();
    all_passed &= test_failure_keeps_result();
    all_passed &= test_edge_horizons();
    all_passed &= test_write_schedule_file();

    std::cout << "\n============================================================================\n";
    if (not all_passed)
    {
        std::cout << "Some tests FAILED\n";
        return 1;
    }
    std::cout << "All pipeline tests PASSED\n";
    return 0;
}
