/**
 * @file SaturationModel.cpp
 * @brief Implementation of the saturation vapour pressure correlation
 */

#include "SaturationModel.hpp"
#include "EngineError.hpp"
#include "MACB.hpp"
#include <cmath>
#include <sstream>

namespace MACB {

namespace SaturationModel {

namespace {
    // Over ice, -100 to 0 °C
    constexpr double C1 = -5.6745359e+03;
    constexpr double C2 = 6.3925247e+00;
    constexpr double C3 = -9.6778430e-03;
    constexpr double C4 = 6.2215701e-07;
    constexpr double C5 = 2.0747825e-09;
    constexpr double C6 = -9.4840240e-13;
    constexpr double C7 = 4.1635019e+00;

    // Over liquid water, 0 to 200 °C
    constexpr double C8 = -5.8002206e+03;
    constexpr double C9 = 1.3914993e+00;
    constexpr double C10 = -4.8640239e-02;
    constexpr double C11 = 4.1764768e-05;
    constexpr double C12 = -1.4452093e-08;
    constexpr double C13 = 6.5459673e+00;

    double lnPws(double T_C) {
        const double T = T_C + PsychroConstants::ZERO_CELSIUS_K;
        if (T_C < 0.0) {
            return C1 / T + C2 + C3 * T + C4 * T * T + C5 * T * T * T
                 + C6 * T * T * T * T + C7 * std::log(T);
        }
        return C8 / T + C9 + C10 * T + C11 * T * T + C12 * T * T * T
             + C13 * std::log(T);
    }
}

void checkTemperature(double temperature, const char* field) {
    if (!std::isfinite(temperature) ||
        temperature < PsychroConstants::T_MIN ||
        temperature > PsychroConstants::T_MAX) {
        std::ostringstream oss;
        oss << "temperature " << temperature << " degC outside ["
            << PsychroConstants::T_MIN << ", " << PsychroConstants::T_MAX << "] degC";
        throw EngineError(ErrorKind::TEMPERATURE_OUT_OF_RANGE, field, oss.str());
    }
}

double saturationVaporPressure(double temperature) {
    checkTemperature(temperature);
    return std::exp(lnPws(temperature));
}

double dLnPwsdT(double temperature) {
    checkTemperature(temperature);
    const double T = temperature + PsychroConstants::ZERO_CELSIUS_K;
    if (temperature < 0.0) {
        return -C1 / (T * T) + C3 + 2.0 * C4 * T + 3.0 * C5 * T * T
             + 4.0 * C6 * T * T * T + C7 / T;
    }
    return -C8 / (T * T) + C10 + 2.0 * C11 * T + 3.0 * C12 * T * T + C13 / T;
}

double saturationHumidityRatio(double temperature, double pressure) {
    const double p_ws = saturationVaporPressure(temperature);
    if (!std::isfinite(pressure) || pressure <= p_ws) {
        std::ostringstream oss;
        oss << "pressure " << pressure << " Pa does not exceed saturation pressure "
            << p_ws << " Pa at " << temperature << " degC";
        throw EngineError(ErrorKind::INVALID_INPUT, "pressure_pa", oss.str());
    }
    return PsychroConstants::MOLAR_MASS_RATIO * p_ws / (pressure - p_ws);
}

} // namespace SaturationModel

} // namespace MACB
