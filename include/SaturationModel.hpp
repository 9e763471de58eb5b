#ifndef SATURATION_MODEL_HPP
#define SATURATION_MODEL_HPP

/**
 * @file SaturationModel.hpp
 * @brief Saturation pressure of water vapour over ice and liquid water
 *
 * Hyland-Wexler correlation as given in the ASHRAE Handbook -
 * Fundamentals (2017), chapter 1, equations 5 (over ice, -100..0 °C)
 * and 6 (over liquid water, 0..200 °C).
 */

namespace MACB {

namespace SaturationModel {

/**
 * @brief Saturation vapour pressure
 * @param temperature Dry-bulb temperature (°C)
 * @return Saturation vapour pressure (Pa)
 * @throws EngineError TEMPERATURE_OUT_OF_RANGE outside [-100, 200] °C
 */
double saturationVaporPressure(double temperature);

/**
 * @brief d(ln p_ws)/dT (1/K), same branch selection as saturationVaporPressure
 */
double dLnPwsdT(double temperature);

/**
 * @brief Humidity ratio of saturated air (kg/kg dry air)
 * @throws EngineError INVALID_INPUT when pressure does not exceed p_ws
 */
double saturationHumidityRatio(double temperature, double pressure);

/**
 * @brief Throw TEMPERATURE_OUT_OF_RANGE unless T lies inside [-100, 200] °C
 */
void checkTemperature(double temperature, const char* field = "temperature_c");

} // namespace SaturationModel

} // namespace MACB

#endif // SATURATION_MODEL_HPP
