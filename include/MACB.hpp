#ifndef MACB_HPP
#define MACB_HPP

/**
 * @file MACB.hpp
 * @brief Common constants and settings for the moist-air balance engine
 *
 * All engine calculations are performed in SI units: temperatures in
 * degrees Celsius, pressures in Pa, enthalpies in J/kg dry air.
 */

#include <string>

#define MACB_VERSION_MAJOR 1
#define MACB_VERSION_MINOR 0
#define MACB_VERSION_STRING "1.0.0"

namespace MACB {

// =============================================================================
// Psychrometric Constants (ASHRAE Handbook - Fundamentals, chapter 1)
// =============================================================================
namespace PsychroConstants {
    constexpr double ZERO_CELSIUS_K = 273.15;           // K
    constexpr double P0_STD = 101325.0;                 // Pa, sea-level standard

    // Ratio of molecular masses of water vapour and dry air
    constexpr double MOLAR_MASS_RATIO = 0.621945;

    // Specific gas constant of dry air (J/(kg·K))
    constexpr double R_DRY_AIR = 287.042;

    // 1 / MOLAR_MASS_RATIO, used by the specific volume relation
    constexpr double VOLUME_VAPOR_FACTOR = 1.607858;

    // Enthalpy coefficients (kJ/kg)
    constexpr double CP_DRY_AIR = 1.006;                // kJ/(kg·K)
    constexpr double CP_WATER_VAPOR = 1.86;             // kJ/(kg·K)
    constexpr double H_FG_0C = 2501.0;                  // kJ/kg at 0 °C

    // Domain of the saturation correlation (°C)
    constexpr double T_MIN = -100.0;
    constexpr double T_MAX = 200.0;

    // Domain of the standard atmosphere relation (m)
    constexpr double ALTITUDE_MIN = -5000.0;
    constexpr double ALTITUDE_MAX = 11000.0;

    // Floor for a non-positive wet-bulb humidity ratio (kg/kg), capped at
    // MIN_HUMIDITY_RATIO_FRACTION of W_s(T_db) so it never adds measurable RH
    constexpr double MIN_HUMIDITY_RATIO = 1e-7;
    constexpr double MIN_HUMIDITY_RATIO_FRACTION = 1e-4;
}

// =============================================================================
// Unit conversions used by the geometry and balance calculations
// =============================================================================
namespace Conversions {
    constexpr double MM_TO_M = 1.0e-3;
    constexpr double LPS_TO_M3PS = 1.0e-3;
    constexpr double KJ_TO_J = 1.0e3;
}

/**
 * @brief Raw measurement at one station (inlet or outlet)
 */
struct StationReading {
    double dry_bulb_c;              // °C
    double relative_humidity_pct;   // %, 0..100
    double co2_ppm;                 // ppm
};

/**
 * @brief Numerical settings for the iterative solvers
 *
 * Passed explicitly into every solver call; there is no process-wide
 * solver or unit configuration.
 */
struct SolverSettings {
    double temperature_tolerance = 1e-4;       // °C, bracket width
    double humidity_ratio_tolerance = 1e-5;    // kg/kg, final residual
    int max_iterations = 100;

    /**
     * @brief Throw EngineError(INVALID_INPUT) on nonsensical values
     */
    void validate() const;
};

} // namespace MACB

#endif // MACB_HPP
