#ifndef STANDARD_ATMOSPHERE_HPP
#define STANDARD_ATMOSPHERE_HPP

/**
 * @file StandardAtmosphere.hpp
 * @brief Standard atmosphere pressure/temperature as a function of altitude
 *
 * Uses the ASHRAE form of the ICAO standard atmosphere troposphere:
 *
 *   p(Z) = 101325 * (1 - 2.25577e-5 Z)^5.2559    [Pa]
 *   T(Z) = 15 - 0.0065 Z                        [°C]
 *
 * valid for -5000 m <= Z <= 11000 m.
 */

namespace MACB {

namespace StandardAtmosphere {

/**
 * @brief Standard static pressure at altitude
 * @param altitude Altitude in m
 * @return Pressure in Pa
 * @throws EngineError ALTITUDE_OUT_OF_RANGE outside [-5000, 11000] m
 */
double pressure(double altitude);

/**
 * @brief Standard temperature at altitude
 * @param altitude Altitude in m
 * @return Temperature in °C
 * @throws EngineError ALTITUDE_OUT_OF_RANGE outside [-5000, 11000] m
 */
double temperature(double altitude);

/**
 * @brief Throw ALTITUDE_OUT_OF_RANGE unless altitude lies inside the model domain
 */
void checkAltitude(double altitude);

} // namespace StandardAtmosphere

/**
 * @brief Engine entry point: standard atmospheric pressure from altitude (Pa)
 */
double pressureFromAltitude(double altitude_m);

} // namespace MACB

#endif // STANDARD_ATMOSPHERE_HPP
