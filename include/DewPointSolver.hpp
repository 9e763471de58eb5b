#ifndef DEW_POINT_SOLVER_HPP
#define DEW_POINT_SOLVER_HPP

/**
 * @file DewPointSolver.hpp
 * @brief Dew-point temperature from partial vapour pressure
 *
 * Inverts SaturationModel::saturationVaporPressure with a safeguarded
 * Newton iteration on ln p_ws(T) - ln p_v. The root is kept bracketed in
 * [-100, 200] °C; any Newton step leaving the bracket is replaced by a
 * bisection step.
 */

#include "MACB.hpp"

namespace MACB {

struct DewPointResult {
    double dew_point;       // °C
    int iterations;
};

class DewPointSolver {
public:
    explicit DewPointSolver(const SolverSettings& settings = SolverSettings());

    /**
     * @brief Dew-point temperature (°C)
     * @param vapor_pressure Partial vapour pressure (Pa)
     * @throws EngineError INVALID_INPUT if p_v <= 0,
     *         CONVERGENCE_FAILURE if p_v is not bracketable or the cap is hit
     */
    double solve(double vapor_pressure) const;

    DewPointResult solveDetailed(double vapor_pressure) const;

    const SolverSettings& settings() const { return settings_; }

private:
    SolverSettings settings_;

    // Magnus-type starting estimate
    static double initialGuess(double vapor_pressure);
};

/**
 * @brief Convenience wrapper around DewPointSolver::solve
 */
double dewPoint(double vapor_pressure, const SolverSettings& settings = SolverSettings());

} // namespace MACB

#endif // DEW_POINT_SOLVER_HPP
