#ifndef WET_BULB_SOLVER_HPP
#define WET_BULB_SOLVER_HPP

/**
 * @file WetBulbSolver.hpp
 * @brief Thermodynamic wet-bulb temperature from dry-bulb, RH and pressure
 *
 * The wet-bulb temperature T_wb is the temperature at which the
 * adiabatic-saturation humidity ratio (ASHRAE Fundamentals ch.1 eq. 33,
 * or eq. 35 below freezing) equals the humidity ratio of the air:
 *
 *   W(T_wb) = ((2501 - 2.326 T_wb) W_s(T_wb) - 1.006 (T_db - T_wb))
 *             / (2501 + 1.86 T_db - 4.186 T_wb)
 *
 * W(T_wb) is increasing in T_wb, so the root is found by bisection over
 * [T_dp, T_db] and the result is interpolated linearly in W across the
 * final bracket. When the dew point lies below the saturation model's
 * lower limit (including RH = 0) that limit is the lower end instead.
 *
 * Saturated air (RH = 100) returns T_db at any pressure. Otherwise P must
 * exceed p_ws(T_db).
 */

#include "MACB.hpp"

namespace MACB {

struct WetBulbResult {
    double wet_bulb;            // °C
    double humidity_ratio;      // kg/kg dry air, from RH; NaN if saturated with P <= p_ws
    int iterations;             // 0 at saturation
};

class WetBulbSolver {
public:
    explicit WetBulbSolver(const SolverSettings& settings = SolverSettings());

    /**
     * @brief Wet-bulb temperature (°C)
     * @param dry_bulb Dry-bulb temperature (°C)
     * @param relative_humidity Relative humidity (%), 0..100
     * @param pressure Atmospheric pressure (Pa)
     * @throws EngineError TEMPERATURE_OUT_OF_RANGE (also when the wet bulb
     *         falls below -100 °C), INVALID_INPUT or CONVERGENCE_FAILURE
     */
    double solve(double dry_bulb, double relative_humidity, double pressure) const;

    WetBulbResult solveDetailed(double dry_bulb, double relative_humidity,
                                double pressure) const;

    /**
     * @brief Humidity ratio from the wet-bulb energy balance (kg/kg)
     *
     * Not floored; may be slightly negative for very dry air.
     */
    static double humidityRatioFromWetBulb(double dry_bulb, double wet_bulb,
                                           double pressure);

    const SolverSettings& settings() const { return settings_; }

private:
    SolverSettings settings_;
};

double wetBulb(double dry_bulb, double relative_humidity, double pressure,
               const SolverSettings& settings = SolverSettings());

} // namespace MACB

#endif // WET_BULB_SOLVER_HPP
