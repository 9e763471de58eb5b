#ifndef MOIST_AIR_PROPERTIES_HPP
#define MOIST_AIR_PROPERTIES_HPP

/**
 * @file MoistAirProperties.hpp
 * @brief Consistent moist-air state from dry-bulb, wet-bulb and pressure
 *
 * All properties are derived from a single humidity ratio W obtained from
 * the wet-bulb energy balance, so that any one of them can be recomputed
 * from the others through its defining relation:
 *
 *   p_v = P W / (0.621945 + W)
 *   RH  = 100 p_v / p_ws(T_db)
 *   h   = 1000 (1.006 T_db + W (2501 + 1.86 T_db))       J/kg dry air
 *   v   = 287.042 (T_db + 273.15)(1 + 1.607858 W) / P     m³/kg dry air
 *   mu  = W / W_s(T_db, P)
 *   rho = (1 + W) / v                                     kg/m³
 */

#include "MACB.hpp"

namespace MACB {

/**
 * @brief Thermodynamic state of moist air at one measurement station
 */
struct MoistAirState {
    double dry_bulb_c;              // Dry-bulb temperature (°C)
    double pressure_pa;             // Atmospheric pressure (Pa)
    double humidity_ratio;          // kg water / kg dry air
    double wet_bulb_c;              // Wet-bulb temperature (°C)
    double dew_point_c;             // Dew-point temperature (°C)
    double relative_humidity_pct;   // Relative humidity (%)
    double vapor_pressure_pa;       // Partial pressure of water vapour (Pa)
    double enthalpy_jkg;            // Moist-air enthalpy (J/kg dry air)
    double specific_volume_m3kg;    // m³ / kg dry air
    double density_kgm3;            // Moist-air density (kg/m³)
    double degree_of_saturation;    // W / W_s
    double dry_air_enthalpy_jkg;    // Dry-air enthalpy (J/kg dry air)
};

// =============================================================================
// Psychrometric relations
// =============================================================================
namespace Psychrometrics {

void checkRelativeHumidity(double relative_humidity);
void checkPressure(double pressure);

double vaporPressureFromRelativeHumidity(double dry_bulb, double relative_humidity);
double humidityRatioFromVaporPressure(double vapor_pressure, double pressure);
double vaporPressureFromHumidityRatio(double humidity_ratio, double pressure);
double humidityRatioFromRelativeHumidity(double dry_bulb, double relative_humidity,
                                         double pressure);

double dryAirEnthalpy(double dry_bulb);
double moistAirEnthalpy(double dry_bulb, double humidity_ratio);
double moistAirVolume(double dry_bulb, double humidity_ratio, double pressure);
double moistAirDensity(double dry_bulb, double humidity_ratio, double pressure);
double degreeOfSaturation(double dry_bulb, double humidity_ratio, double pressure);

} // namespace Psychrometrics

/**
 * @brief Builds MoistAirState values
 *
 * Stateless apart from the solver settings, which are fixed at
 * construction; a single instance may be shared between threads.
 */
class MoistAirCalculator {
public:
    explicit MoistAirCalculator(const SolverSettings& settings = SolverSettings());

    /**
     * @brief Full state from dry-bulb and wet-bulb temperatures
     *
     * A non-positive W from the wet-bulb balance is raised to
     * min(1e-7, 1e-4 W_s(T_db)). A dew point below -100 °C is reported
     * as -100 °C.
     * @param dry_bulb Dry-bulb temperature (°C)
     * @param wet_bulb Wet-bulb temperature (°C), must not exceed dry_bulb
     * @param pressure Atmospheric pressure (Pa)
     */
    MoistAirState properties(double dry_bulb, double wet_bulb, double pressure) const;

    /**
     * @brief Full state from a station reading: wet-bulb solve then properties()
     */
    MoistAirState fromRelativeHumidity(double dry_bulb, double relative_humidity,
                                       double pressure) const;

    const SolverSettings& settings() const { return settings_; }

private:
    SolverSettings settings_;
};

} // namespace MACB

#endif // MOIST_AIR_PROPERTIES_HPP
