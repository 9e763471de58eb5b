/**
 * @file DewPointSolver.cpp
 * @brief Implementation of the dew-point solver
 */

#include "DewPointSolver.hpp"
#include "EngineError.hpp"
#include "SaturationModel.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace MACB {

DewPointSolver::DewPointSolver(const SolverSettings& settings) : settings_(settings) {
    settings_.validate();
}

double DewPointSolver::initialGuess(double vapor_pressure) {
    const double a = 17.27, b = 237.3;
    double gamma = std::log(vapor_pressure / 610.78);
    return b * gamma / (a - gamma);
}

double DewPointSolver::solve(double vapor_pressure) const {
    return solveDetailed(vapor_pressure).dew_point;
}

DewPointResult DewPointSolver::solveDetailed(double vapor_pressure) const {
    if (!std::isfinite(vapor_pressure) || vapor_pressure <= 0.0) {
        std::ostringstream oss;
        oss << "vapour pressure must be positive (got " << vapor_pressure << " Pa)";
        throw EngineError(ErrorKind::INVALID_INPUT, "vapor_pressure_pa", oss.str());
    }

    double lo = PsychroConstants::T_MIN;
    double hi = PsychroConstants::T_MAX;
    const double p_lo = SaturationModel::saturationVaporPressure(lo);
    const double p_hi = SaturationModel::saturationVaporPressure(hi);
    if (vapor_pressure < p_lo || vapor_pressure > p_hi) {
        std::ostringstream oss;
        oss << "vapour pressure " << vapor_pressure << " Pa not bracketed by ["
            << p_lo << ", " << p_hi << "] Pa";
        throw EngineError(ErrorKind::CONVERGENCE_FAILURE, "vapor_pressure_pa", oss.str());
    }

    const double ln_target = std::log(vapor_pressure);
    double T = std::min(std::max(initialGuess(vapor_pressure), lo), hi);

    for (int iter = 1; iter <= settings_.max_iterations; ++iter) {
        double f = std::log(SaturationModel::saturationVaporPressure(T)) - ln_target;
        if (f == 0.0) return {T, iter};

        // ln p_ws is increasing in T, so the sign of f tells which side T is on
        if (f > 0.0) {
            hi = T;
        } else {
            lo = T;
        }

        double T_new = T - f / SaturationModel::dLnPwsdT(T);
        if (!(T_new > lo && T_new < hi)) {
            T_new = 0.5 * (lo + hi);
        }

        if (std::abs(T_new - T) < settings_.temperature_tolerance ||
            (hi - lo) < settings_.temperature_tolerance) {
            return {T_new, iter};
        }
        T = T_new;
    }

    std::ostringstream oss;
    oss << "no convergence after " << settings_.max_iterations
        << " iterations for p_v = " << vapor_pressure << " Pa";
    throw EngineError(ErrorKind::CONVERGENCE_FAILURE, "dew_point_c", oss.str());
}

double dewPoint(double vapor_pressure, const SolverSettings& settings) {
    return DewPointSolver(settings).solve(vapor_pressure);
}

} // namespace MACB
