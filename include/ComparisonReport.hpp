#ifndef COMPARISON_REPORT_HPP
#define COMPARISON_REPORT_HPP

/**
 * @file ComparisonReport.hpp
 * @brief Inlet/outlet comparison of one air-handling snapshot
 *
 * buildReport() is the engine's top-level entry point. It is a pure
 * function: no shared state, no I/O, safe to call concurrently.
 */

#include "BalanceCalculator.hpp"
#include "MACB.hpp"
#include "MoistAirProperties.hpp"
#include "ProcessGeometry.hpp"

namespace MACB {

/**
 * @brief Outlet minus inlet for every state field and raw reading
 */
struct MoistAirDelta {
    double dry_bulb_c;
    double pressure_pa;                     // Zero: both stations share one pressure
    double input_relative_humidity_pct;     // From the readings
    double co2_ppm;
    double wet_bulb_c;
    double humidity_ratio;
    double dew_point_c;
    double relative_humidity_pct;           // Recomputed by the engine
    double vapor_pressure_pa;
    double enthalpy_jkg;
    double specific_volume_m3kg;
    double degree_of_saturation;
    double dry_air_enthalpy_jkg;
    double density_kgm3;
};

struct ComparisonReport {
    double pressure_pa;                 // Standard pressure at the site altitude
    ProcessGeometry process;
    StationReading inlet_reading;
    StationReading outlet_reading;
    MoistAirState inlet;
    MoistAirState outlet;
    DerivedGeometry geometry;
    BalanceResult balance;
    MoistAirDelta delta;
};

/**
 * @brief Throw INVALID_INPUT / TEMPERATURE_OUT_OF_RANGE for an unusable reading
 */
void validateReading(const StationReading& reading);

MoistAirDelta computeDelta(const StationReading& inlet_reading,
                           const StationReading& outlet_reading,
                           const MoistAirState& inlet, const MoistAirState& outlet);

/**
 * @brief Assemble the full comparison report
 *
 * Fails on the first error of any step; the thrown EngineError keeps its
 * kind and carries the field path ("inlet.relative_humidity_pct",
 * "geometry.altitude_m", ...). No partial report is ever returned.
 */
ComparisonReport buildReport(const StationReading& inlet, const StationReading& outlet,
                             const ProcessGeometry& geometry,
                             const SolverSettings& settings = SolverSettings());

} // namespace MACB

#endif // COMPARISON_REPORT_HPP
