//
//  greedysolver.hpp
//  planner
//

#ifndef greedysolver_hpp
#define greedysolver_hpp

#include "solver.hpp"

// Preisschwellen-Heuristik: im Niedrigpreis laden, im Hochpreis entladen
class GreedySolver : public DispatchSolver
{
public:
    GreedySolver(float low_percentile = 25);
    const char *Name() const { return "greedy"; }
    bool Solve(const solverinput_s &in, const solverconfig_s &cfg, solverresult_s &out, std::string &err);

private:
    float NeedAhead(const solverinput_s &in, size_t j, float low, float high, float eff_c, float eff_d) const;
    float low_percentile;
};

#endif /* greedysolver_hpp */
