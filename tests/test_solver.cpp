//
//  test_solver.cpp
//  planner
//

#include "testhelper.hpp"
#include "solver.hpp"
#include "greedysolver.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>
#include <chrono>
#include <thread>
#include <atomic>

// rechnet bis zu 3 s, bricht bei Cancel() ab
class SlowSolver : public DispatchSolver
{
public:
    SlowSolver() : saw_cancel(false), finished(false) {}
    const char *Name() const { return "slow"; }
    bool Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err)
    {
        for (int k = 0; k < 60; k++)
        {
            if (Cancelled())
            {
                saw_cancel = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        WriteLog(LOGINFO, "slow solver finished");
        finished = true;
        return false;
    }
    std::atomic<bool> saw_cancel;
    std::atomic<bool> finished;
};

class FailingSolver : public DispatchSolver
{
public:
    FailingSolver(bool do_throw) { this->do_throw = do_throw; }
    const char *Name() const { return "failing"; }
    bool Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err)
    {
        if (do_throw)
            throw std::runtime_error("matrix singular");
        err = "infeasible";
        return false;
    }

private:
    bool do_throw;
};

static solverconfig_s TestSolverConfig()
{
    planner_config_t cfg = TestConfig();
    return BuildSolverConfig(cfg, 0, 0, 8);
}

// vier billige Slots, dann vier teure
static solverinput_s CheapThenExpensive()
{
    std::vector<float> prices(4, 0.5);
    prices.resize(8, 3.0);
    slotseries_t series = TestSeries(TestDay0(), prices, 0, 0.5);
    return BuildSolverInput(series, 0, 1.0);
}

bool test_classify_action() {
    std::cout << "Testing action classification..." << std::flush;
    assert(ClassifyAction(2, 0, 0) == ACT_CHARGE);
    assert(ClassifyAction(0, 2, 0) == ACT_DISCHARGE);
    assert(ClassifyAction(0, 2, 0.5) == ACT_EXPORT);
    assert(ClassifyAction(0.005, 0.005, 0) == ACT_HOLD);
    assert(strcmp(ActionName(ACT_EXPORT), "Export") == 0);
    assert(strcmp(ActionName(ACT_HOLD), "Hold") == 0);
    std::cout << " PASS\n";
    return true;
}

bool test_build_solver_input() {
    std::cout << "Testing solver input and config..." << std::flush;
    std::vector<float> prices(4, 1.0);
    slotseries_t series = TestSeries(TestDay0(), prices, 0.1, 0.3);
    series[2].water_kw = 3;
    solverinput_s in = BuildSolverInput(series, 1, 4.5);
    assert(in.slots.size() == 3);
    assert(in.slots[0].start == series[1].hh);
    assert(std::fabs(in.slots[1].load_kwh - (0.3 + 0.75)) < 1e-5);
    assert(std::fabs(in.initial_soc_kwh - 4.5) < 1e-6);

    planner_config_t cfg = TestConfig();
    solverconfig_s sc = BuildSolverConfig(cfg, 1.2, 0, 8);
    assert(sc.target_penalty == 0);
    sc = BuildSolverConfig(cfg, 1.2, 3, 8);
    assert(sc.target_penalty == 8 && sc.target_soc_kwh == 3);
    cfg.sys.has_battery = false;
    sc = BuildSolverConfig(cfg, 1.2, 0, 8);
    assert(sc.capacity_kwh == 0 && sc.max_charge_kw == 0 && sc.max_discharge_kw == 0);
    std::cout << " PASS\n";
    return true;
}

bool test_greedy_contract() {
    std::cout << "Testing greedy solver result..." << std::flush;
    solverinput_s in = CheapThenExpensive();
    solverconfig_s sc = TestSolverConfig();
    GreedySolver solver;
    solverresult_s out;
    std::string err;
    assert(solver.Solve(in, sc, out, err));
    assert(ValidateSolverResult(in, out, err));

    float min_kwh = sc.capacity_kwh * sc.min_soc_percent / 100;
    bool charged_cheap = false, discharged_expensive = false;
    for (size_t k = 0; k < out.slots.size(); k++)
    {
        const solverslotresult_s &r = out.slots[k];
        assert(r.soc_kwh >= min_kwh - 1e-4 && r.soc_kwh <= sc.capacity_kwh + 1e-4);
        assert(r.charge_kw <= sc.max_charge_kw + 1e-4 && r.discharge_kw <= sc.max_discharge_kw + 1e-4);
        assert(r.import_kwh >= 0 && r.export_kwh >= 0);
        if (k < 4 && r.action == ACT_CHARGE)
            charged_cheap = true;
        if (k >= 4 && r.action == ACT_DISCHARGE)
            discharged_expensive = true;
        // im Hochpreis wird nicht geladen
        if (k >= 4)
            assert(r.charge_kw == 0);
    }
    assert(charged_cheap && discharged_expensive);

    // ohne Speicher: alles aus dem Netz
    planner_config_t cfg = TestConfig();
    cfg.sys.has_battery = false;
    sc = BuildSolverConfig(cfg, 0, 0, 8);
    in.initial_soc_kwh = 0;
    assert(solver.Solve(in, sc, out, err));
    for (size_t k = 0; k < out.slots.size(); k++)
    {
        assert(out.slots[k].action == ACT_HOLD);
        assert(std::fabs(out.slots[k].import_kwh - 0.5) < 1e-5);
    }

    // abgebrochen: kein Ergebnis
    solver.Cancel();
    assert(not solver.Solve(in, sc, out, err));
    assert(err == "cancelled");
    solver.ClearCancel();

    solverinput_s empty;
    empty.initial_soc_kwh = 0;
    assert(solver.Solve(empty, sc, out, err) && out.slots.size() == 0);
    std::cout << " PASS\n";
    return true;
}

bool test_run_solver_errors() {
    std::cout << "Testing solver failures and timeout..." << std::flush;
    solverinput_s in = CheapThenExpensive();
    solverconfig_s sc = TestSolverConfig();
    solverresult_s out;
    out.total_cost = 123;
    std::string err;

    assert(RunSolver(std::make_shared<GreedySolver>(), in, sc, 5, out, err));
    assert(out.slots.size() == in.slots.size());

    // Abbruch eines früheren Laufs gilt nicht für den nächsten
    std::shared_ptr<GreedySolver> greedy = std::make_shared<GreedySolver>();
    greedy->Cancel();
    assert(RunSolver(greedy, in, sc, 5, out, err));
    assert(not greedy->Cancelled());

    solverresult_s untouched;
    untouched.total_cost = 123;
    assert(not RunSolver(std::make_shared<FailingSolver>(false), in, sc, 5, untouched, err));
    assert(err.find("infeasible") != std::string::npos);
    assert(untouched.slots.size() == 0 && untouched.total_cost == 123);

    assert(not RunSolver(std::make_shared<FailingSolver>(true), in, sc, 5, untouched, err));
    assert(err.find("matrix singular") != std::string::npos);

    assert(not RunSolver(std::shared_ptr<DispatchSolver>(), in, sc, 5, untouched, err));

    // Zeitüberschreitung: Abbruch wird gesetzt und der Job endet vor der Rückkehr
    std::shared_ptr<SlowSolver> slow = std::make_shared<SlowSolver>();
    std::chrono::steady_clock::time_point t = std::chrono::steady_clock::now();
    assert(not RunSolver(slow, in, sc, 1, untouched, err));
    WriteLog(LOGINFO, "after timeout");
    assert(err.find("timed out") != std::string::npos);
    assert(std::chrono::steady_clock::now() - t < std::chrono::seconds(3));
    assert(slow->Cancelled());
    assert(slow->saw_cancel);
    assert(slow->finished);
    assert(untouched.slots.size() == 0 && untouched.total_cost == 123);
    std::cout << " PASS\n";
    return true;
}

bool test_validate_result() {
    std::cout << "Testing solver result validation..." << std::flush;
    solverinput_s in = CheapThenExpensive();
    solverconfig_s sc = TestSolverConfig();
    GreedySolver solver;
    solverresult_s out;
    std::string err;
    assert(solver.Solve(in, sc, out, err));

    solverresult_s bad = out;
    bad.slots.pop_back();
    assert(not ValidateSolverResult(in, bad, err));
    assert(err.find("expected") != std::string::npos);

    bad = out;
    std::swap(bad.slots[2].start, bad.slots[3].start);
    assert(not ValidateSolverResult(in, bad, err));

    bad = out;
    bad.slots[5].soc_kwh = NAN;
    assert(not ValidateSolverResult(in, bad, err));
    std::cout << " PASS\n";
    return true;
}

bool test_merge_and_water_split() {
    std::cout << "Testing merge into slots and water energy split..." << std::flush;
    std::vector<float> prices(3, 1.0);
    slotseries_t series = TestSeries(TestDay0(), prices, 0.5, 0.2);
    series[2].water_kw = 4;

    solverresult_s res;
    res.total_cost = 0;
    for (int k = 0; k < 2; k++)
    {
        solverslotresult_s r = solverslotresult_s();
        r.start = series[1 + k].hh;
        res.slots.push_back(r);
    }
    res.slots[0].charge_kw = 2;
    res.slots[0].soc_kwh = 5.5;
    res.slots[1].discharge_kw = 2;
    res.slots[1].soc_kwh = 5.0;

    MergeSolverResult(series, 1, res, 10, 5.0);
    assert(series[0].action == ACT_HOLD && not series[0].entry_soc.set);
    assert(series[1].action == ACT_CHARGE);
    assert(std::fabs(series[1].entry_soc.val - 50) < 1e-4);
    assert(std::fabs(series[1].soc_percent - 55) < 1e-4);
    assert(std::fabs(series[2].entry_soc.val - 55) < 1e-4);
    assert(series[2].action == ACT_DISCHARGE);

    // 1 kWh: 0.3 PV-Überschuss, 0.5 Batterie, Rest Netz
    assert(std::fabs(series[2].water_pv_kwh - 0.3) < 1e-5);
    assert(std::fabs(series[2].water_batt_kwh - 0.5) < 1e-5);
    assert(std::fabs(series[2].water_grid_kwh - 0.2) < 1e-5);
    float sum = series[2].water_pv_kwh + series[2].water_batt_kwh + series[2].water_grid_kwh;
    assert(std::fabs(sum - 1.0) < 1e-5);

    series[2].water_kw = 0;
    SplitWater(series[2]);
    assert(series[2].water_pv_kwh == 0 && series[2].water_grid_kwh == 0);
    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "SOLVER TESTS\n";
    std::cout << "============================================================================\n\n";
    TestInit();

    bool all_passed = true;
    all_passed &= test_classify_action();
    all_passed &= test_build_solver_input();
    all_passed &= test_greedy_contract();
    all_passed &= test_run_solver_errors();
    all_passed &= test_validate_result();
    all_passed &= test_merge_and_water_split();

    std::cout << "\n============================================================================\n";
    if (not all_passed)
    {
        std::cout << "Some tests FAILED\n";
        return 1;
    }
    std::cout << "All solver tests PASSED\n";
    return 0;
}
