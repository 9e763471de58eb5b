/**
 * @file ComparisonReport.cpp
 * @brief Assembly of the inlet/outlet comparison report
 */

#include "ComparisonReport.hpp"
#include "EngineError.hpp"
#include "SaturationModel.hpp"
#include "StandardAtmosphere.hpp"
#include <cmath>

namespace MACB {

namespace {

MoistAirState stationState(const MoistAirCalculator& calculator,
                           const StationReading& reading, double pressure,
                           const char* station) {
    try {
        validateReading(reading);
        return calculator.fromRelativeHumidity(reading.dry_bulb_c,
                                               reading.relative_humidity_pct, pressure);
    } catch (const EngineError& e) {
        throw e.withContext(station);
    }
}

} // namespace

void validateReading(const StationReading& reading) {
    SaturationModel::checkTemperature(reading.dry_bulb_c, "dry_bulb_c");
    Psychrometrics::checkRelativeHumidity(reading.relative_humidity_pct);
    if (!std::isfinite(reading.co2_ppm) || reading.co2_ppm < 0.0) {
        throw EngineError(ErrorKind::INVALID_INPUT, "co2_ppm",
                          "CO2 concentration must be non-negative");
    }
}

MoistAirDelta computeDelta(const StationReading& inlet_reading,
                           const StationReading& outlet_reading,
                           const MoistAirState& inlet, const MoistAirState& outlet) {
    MoistAirDelta d;
    d.dry_bulb_c = outlet.dry_bulb_c - inlet.dry_bulb_c;
    d.pressure_pa = outlet.pressure_pa - inlet.pressure_pa;
    d.input_relative_humidity_pct = outlet_reading.relative_humidity_pct -
                                    inlet_reading.relative_humidity_pct;
    d.co2_ppm = outlet_reading.co2_ppm - inlet_reading.co2_ppm;
    d.wet_bulb_c = outlet.wet_bulb_c - inlet.wet_bulb_c;
    d.humidity_ratio = outlet.humidity_ratio - inlet.humidity_ratio;
    d.dew_point_c = outlet.dew_point_c - inlet.dew_point_c;
    d.relative_humidity_pct = outlet.relative_humidity_pct - inlet.relative_humidity_pct;
    d.vapor_pressure_pa = outlet.vapor_pressure_pa - inlet.vapor_pressure_pa;
    d.enthalpy_jkg = outlet.enthalpy_jkg - inlet.enthalpy_jkg;
    d.specific_volume_m3kg = outlet.specific_volume_m3kg - inlet.specific_volume_m3kg;
    d.degree_of_saturation = outlet.degree_of_saturation - inlet.degree_of_saturation;
    d.dry_air_enthalpy_jkg = outlet.dry_air_enthalpy_jkg - inlet.dry_air_enthalpy_jkg;
    d.density_kgm3 = outlet.density_kgm3 - inlet.density_kgm3;
    return d;
}

ComparisonReport buildReport(const StationReading& inlet, const StationReading& outlet,
                             const ProcessGeometry& geometry,
                             const SolverSettings& settings) {
    try {
        settings.validate();
    } catch (const EngineError& e) {
        throw e.withContext("solver");
    }

    ComparisonReport report;
    report.process = geometry;
    report.inlet_reading = inlet;
    report.outlet_reading = outlet;

    try {
        report.pressure_pa = pressureFromAltitude(geometry.altitude_m);
        report.geometry = deriveGeometry(geometry);
    } catch (const EngineError& e) {
        throw e.withContext("geometry");
    }

    const MoistAirCalculator calculator(settings);
    report.inlet = stationState(calculator, inlet, report.pressure_pa, "inlet");
    report.outlet = stationState(calculator, outlet, report.pressure_pa, "outlet");

    report.balance = computeBalance(inlet, outlet, report.inlet, report.outlet, geometry);
    report.delta = computeDelta(inlet, outlet, report.inlet, report.outlet);

    return report;
}

} // namespace MACB
