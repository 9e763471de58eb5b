/**
 * @file MoistAirProperties.cpp
 * @brief Implementation of moist-air property relations
 */

#include "MoistAirProperties.hpp"
#include "DewPointSolver.hpp"
#include "EngineError.hpp"
#include "SaturationModel.hpp"
#include "WetBulbSolver.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace MACB {

// =============================================================================
// Psychrometrics Implementation
// =============================================================================

namespace Psychrometrics {

void checkRelativeHumidity(double relative_humidity) {
    if (!std::isfinite(relative_humidity) || relative_humidity < 0.0 ||
        relative_humidity > 100.0) {
        std::ostringstream oss;
        oss << "relative humidity must lie in [0, 100] % (got " << relative_humidity << ")";
        throw EngineError(ErrorKind::INVALID_INPUT, "relative_humidity_pct", oss.str());
    }
}

void checkPressure(double pressure) {
    if (!std::isfinite(pressure) || pressure <= 0.0) {
        std::ostringstream oss;
        oss << "pressure must be positive (got " << pressure << " Pa)";
        throw EngineError(ErrorKind::INVALID_INPUT, "pressure_pa", oss.str());
    }
}

double vaporPressureFromRelativeHumidity(double dry_bulb, double relative_humidity) {
    checkRelativeHumidity(relative_humidity);
    return relative_humidity / 100.0 * SaturationModel::saturationVaporPressure(dry_bulb);
}

double humidityRatioFromVaporPressure(double vapor_pressure, double pressure) {
    checkPressure(pressure);
    if (vapor_pressure < 0.0 || vapor_pressure >= pressure) {
        std::ostringstream oss;
        oss << "vapour pressure " << vapor_pressure << " Pa outside [0, " << pressure << ") Pa";
        throw EngineError(ErrorKind::INVALID_INPUT, "vapor_pressure_pa", oss.str());
    }
    return PsychroConstants::MOLAR_MASS_RATIO * vapor_pressure / (pressure - vapor_pressure);
}

double vaporPressureFromHumidityRatio(double humidity_ratio, double pressure) {
    checkPressure(pressure);
    if (!std::isfinite(humidity_ratio) || humidity_ratio < 0.0) {
        throw EngineError(ErrorKind::INVALID_INPUT, "humidity_ratio",
                          "humidity ratio must be non-negative");
    }
    return pressure * humidity_ratio / (PsychroConstants::MOLAR_MASS_RATIO + humidity_ratio);
}

double humidityRatioFromRelativeHumidity(double dry_bulb, double relative_humidity,
                                         double pressure) {
    return humidityRatioFromVaporPressure(
        vaporPressureFromRelativeHumidity(dry_bulb, relative_humidity), pressure);
}

double dryAirEnthalpy(double dry_bulb) {
    return PsychroConstants::CP_DRY_AIR * dry_bulb * Conversions::KJ_TO_J;
}

double moistAirEnthalpy(double dry_bulb, double humidity_ratio) {
    return (PsychroConstants::CP_DRY_AIR * dry_bulb +
            humidity_ratio * (PsychroConstants::H_FG_0C +
                              PsychroConstants::CP_WATER_VAPOR * dry_bulb)) *
           Conversions::KJ_TO_J;
}

double moistAirVolume(double dry_bulb, double humidity_ratio, double pressure) {
    checkPressure(pressure);
    return PsychroConstants::R_DRY_AIR * (dry_bulb + PsychroConstants::ZERO_CELSIUS_K) *
           (1.0 + PsychroConstants::VOLUME_VAPOR_FACTOR * humidity_ratio) / pressure;
}

double moistAirDensity(double dry_bulb, double humidity_ratio, double pressure) {
    return (1.0 + humidity_ratio) / moistAirVolume(dry_bulb, humidity_ratio, pressure);
}

double degreeOfSaturation(double dry_bulb, double humidity_ratio, double pressure) {
    return humidity_ratio / SaturationModel::saturationHumidityRatio(dry_bulb, pressure);
}

} // namespace Psychrometrics

// =============================================================================
// MoistAirCalculator Implementation
// =============================================================================

MoistAirCalculator::MoistAirCalculator(const SolverSettings& settings) : settings_(settings) {
    settings_.validate();
}

MoistAirState MoistAirCalculator::properties(double dry_bulb, double wet_bulb,
                                             double pressure) const {
    SaturationModel::checkTemperature(dry_bulb, "dry_bulb_c");
    SaturationModel::checkTemperature(wet_bulb, "wet_bulb_c");
    Psychrometrics::checkPressure(pressure);

    if (wet_bulb > dry_bulb + settings_.temperature_tolerance) {
        std::ostringstream oss;
        oss << "wet-bulb " << wet_bulb << " degC exceeds dry-bulb " << dry_bulb << " degC";
        throw EngineError(ErrorKind::INVALID_INPUT, "wet_bulb_c", oss.str());
    }
    wet_bulb = std::min(wet_bulb, dry_bulb);

    MoistAirState s;
    s.dry_bulb_c = dry_bulb;
    s.pressure_pa = pressure;
    s.wet_bulb_c = wet_bulb;

    s.humidity_ratio = WetBulbSolver::humidityRatioFromWetBulb(dry_bulb, wet_bulb, pressure);
    if (s.humidity_ratio <= 0.0) {
        s.humidity_ratio = std::min(
            PsychroConstants::MIN_HUMIDITY_RATIO,
            PsychroConstants::MIN_HUMIDITY_RATIO_FRACTION *
                SaturationModel::saturationHumidityRatio(dry_bulb, pressure));
    }
    s.vapor_pressure_pa = Psychrometrics::vaporPressureFromHumidityRatio(s.humidity_ratio,
                                                                         pressure);

    // Dew points below the saturation model range are reported at its limit.
    // Bounded by T_wb: the two solvers each carry their own tolerance.
    if (s.vapor_pressure_pa < SaturationModel::saturationVaporPressure(PsychroConstants::T_MIN)) {
        s.dew_point_c = PsychroConstants::T_MIN;
    } else {
        s.dew_point_c = DewPointSolver(settings_).solve(s.vapor_pressure_pa);
    }
    s.dew_point_c = std::min(s.dew_point_c, wet_bulb);

    s.relative_humidity_pct = 100.0 * s.vapor_pressure_pa /
                              SaturationModel::saturationVaporPressure(dry_bulb);
    s.enthalpy_jkg = Psychrometrics::moistAirEnthalpy(dry_bulb, s.humidity_ratio);
    s.specific_volume_m3kg = Psychrometrics::moistAirVolume(dry_bulb, s.humidity_ratio,
                                                            pressure);
    s.degree_of_saturation = Psychrometrics::degreeOfSaturation(dry_bulb, s.humidity_ratio,
                                                                pressure);
    s.density_kgm3 = (1.0 + s.humidity_ratio) / s.specific_volume_m3kg;
    s.dry_air_enthalpy_jkg = Psychrometrics::dryAirEnthalpy(dry_bulb);
    return s;
}

MoistAirState MoistAirCalculator::fromRelativeHumidity(double dry_bulb, double relative_humidity,
                                                       double pressure) const {
    const double wet_bulb = WetBulbSolver(settings_).solve(dry_bulb, relative_humidity, pressure);
    return properties(dry_bulb, wet_bulb, pressure);
}

} // namespace MACB
