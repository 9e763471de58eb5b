/**
 * @file WetBulbSolver.cpp
 * @brief Implementation of the wet-bulb temperature solver
 */

#include "WetBulbSolver.hpp"
#include "DewPointSolver.hpp"
#include "EngineError.hpp"
#include "MoistAirProperties.hpp"
#include "SaturationModel.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace MACB {

WetBulbSolver::WetBulbSolver(const SolverSettings& settings) : settings_(settings) {
    settings_.validate();
}

double WetBulbSolver::humidityRatioFromWetBulb(double dry_bulb, double wet_bulb,
                                               double pressure) {
    const double Ws_star = SaturationModel::saturationHumidityRatio(wet_bulb, pressure);
    if (wet_bulb >= 0.0) {
        return ((2501.0 - 2.326 * wet_bulb) * Ws_star - 1.006 * (dry_bulb - wet_bulb)) /
               (2501.0 + 1.86 * dry_bulb - 4.186 * wet_bulb);
    }
    // Below freezing: saturation over ice
    return ((2830.0 - 0.24 * wet_bulb) * Ws_star - 1.006 * (dry_bulb - wet_bulb)) /
           (2830.0 + 1.86 * dry_bulb - 2.1 * wet_bulb);
}

double WetBulbSolver::solve(double dry_bulb, double relative_humidity, double pressure) const {
    return solveDetailed(dry_bulb, relative_humidity, pressure).wet_bulb;
}

WetBulbResult WetBulbSolver::solveDetailed(double dry_bulb, double relative_humidity,
                                           double pressure) const {
    SaturationModel::checkTemperature(dry_bulb, "dry_bulb_c");
    Psychrometrics::checkRelativeHumidity(relative_humidity);
    Psychrometrics::checkPressure(pressure);

    const double p_v = Psychrometrics::vaporPressureFromRelativeHumidity(dry_bulb,
                                                                        relative_humidity);

    // Saturated air: T_wb = T_db at any pressure
    if (relative_humidity == 100.0) {
        const double W = p_v < pressure
                             ? Psychrometrics::humidityRatioFromVaporPressure(p_v, pressure)
                             : std::numeric_limits<double>::quiet_NaN();
        return {dry_bulb, W, 0};
    }

    // Also rejects P <= p_ws(T_db), where no saturated state exists
    SaturationModel::saturationHumidityRatio(dry_bulb, pressure);
    const double W = Psychrometrics::humidityRatioFromVaporPressure(p_v, pressure);

    double lo = PsychroConstants::T_MIN;
    if (p_v > SaturationModel::saturationVaporPressure(PsychroConstants::T_MIN)) {
        lo = DewPointSolver(settings_).solve(p_v);
    }
    lo = std::min(lo, dry_bulb);
    double hi = dry_bulb;

    // The dew point carries the dew-point solver's error and may sit
    // marginally above the root; step below it.
    double W_lo = humidityRatioFromWetBulb(dry_bulb, lo, pressure);
    if (W_lo >= W && lo > PsychroConstants::T_MIN) {
        lo = std::max(PsychroConstants::T_MIN, lo - 1.0);
        W_lo = humidityRatioFromWetBulb(dry_bulb, lo, pressure);
    }
    if (W_lo > W) {
        std::ostringstream oss;
        oss << "root not bracketed: W(" << lo << " degC) = " << W_lo
            << " exceeds W = " << W << " kg/kg";
        if (lo == PsychroConstants::T_MIN) {
            throw EngineError(ErrorKind::TEMPERATURE_OUT_OF_RANGE, "wet_bulb_c",
                              oss.str() + "; wet bulb lies below the saturation model range");
        }
        throw EngineError(ErrorKind::CONVERGENCE_FAILURE, "wet_bulb_c", oss.str());
    }
    if (W_lo == W) {
        return {lo, W, 0};
    }
    double W_hi = humidityRatioFromWetBulb(dry_bulb, hi, pressure);

    for (int iter = 1; iter <= settings_.max_iterations; ++iter) {
        const double mid = 0.5 * (lo + hi);
        const double W_mid = humidityRatioFromWetBulb(dry_bulb, mid, pressure);
        if (W_mid > W) {
            hi = mid;
            W_hi = W_mid;
        } else {
            lo = mid;
            W_lo = W_mid;
        }

        if (hi - lo < settings_.temperature_tolerance) {
            // Interpolate W across the final bracket so W(T_wb) matches W
            // even where W_s is tiny (cold air)
            double wet_bulb = 0.5 * (lo + hi);
            if (W_hi > W_lo) {
                wet_bulb = lo + (W - W_lo) * (hi - lo) / (W_hi - W_lo);
            }

            const double residual =
                std::abs(humidityRatioFromWetBulb(dry_bulb, wet_bulb, pressure) - W);
            if (residual > settings_.humidity_ratio_tolerance) {
                std::ostringstream oss;
                oss << "residual " << residual << " kg/kg exceeds humidity ratio tolerance "
                    << settings_.humidity_ratio_tolerance;
                throw EngineError(ErrorKind::CONVERGENCE_FAILURE, "wet_bulb_c", oss.str());
            }
            return {wet_bulb, W, iter};
        }
    }

    std::ostringstream oss;
    oss << "no convergence after " << settings_.max_iterations << " iterations (T_db = "
        << dry_bulb << " degC, RH = " << relative_humidity << " %)";
    throw EngineError(ErrorKind::CONVERGENCE_FAILURE, "wet_bulb_c", oss.str());
}

double wetBulb(double dry_bulb, double relative_humidity, double pressure,
               const SolverSettings& settings) {
    return WetBulbSolver(settings).solve(dry_bulb, relative_humidity, pressure);
}

} // namespace MACB
