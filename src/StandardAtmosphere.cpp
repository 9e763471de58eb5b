/**
 * @file StandardAtmosphere.cpp
 * @brief Implementation of the standard atmosphere relations
 */

#include "StandardAtmosphere.hpp"
#include "EngineError.hpp"
#include "MACB.hpp"
#include <cmath>
#include <sstream>

namespace MACB {

namespace StandardAtmosphere {

namespace {
    constexpr double PRESSURE_LAPSE = 2.25577e-5;   // 1/m
    constexpr double PRESSURE_EXPONENT = 5.2559;
    constexpr double T0_CELSIUS = 15.0;
    constexpr double TEMPERATURE_LAPSE = 0.0065;    // K/m
}

void checkAltitude(double altitude) {
    if (!std::isfinite(altitude) ||
        altitude < PsychroConstants::ALTITUDE_MIN ||
        altitude > PsychroConstants::ALTITUDE_MAX) {
        std::ostringstream oss;
        oss << "altitude " << altitude << " m outside ["
            << PsychroConstants::ALTITUDE_MIN << ", "
            << PsychroConstants::ALTITUDE_MAX << "] m";
        throw EngineError(ErrorKind::ALTITUDE_OUT_OF_RANGE, "altitude_m", oss.str());
    }
}

double pressure(double altitude) {
    checkAltitude(altitude);
    return PsychroConstants::P0_STD *
           std::pow(1.0 - PRESSURE_LAPSE * altitude, PRESSURE_EXPONENT);
}

double temperature(double altitude) {
    checkAltitude(altitude);
    return T0_CELSIUS - TEMPERATURE_LAPSE * altitude;
}

} // namespace StandardAtmosphere

double pressureFromAltitude(double altitude_m) {
    return StandardAtmosphere::pressure(altitude_m);
}

} // namespace MACB
