/**
 * @file BalanceCalculator.cpp
 * @brief Implementation of the inlet/outlet balance
 */

#include "BalanceCalculator.hpp"
#include "EngineError.hpp"
#include <cmath>

namespace MACB {

std::string toString(Co2Change change) {
    switch (change) {
        case Co2Change::RELEASE:   return "CO2 Release";
        case Co2Change::CAPTURE:   return "CO2 Capture";
        case Co2Change::NO_CHANGE: return "No Change in CO2";
    }
    return "Unknown";
}

Co2Change classifyCo2Change(double co2_change) {
    if (co2_change > 0.0) return Co2Change::RELEASE;
    if (co2_change < 0.0) return Co2Change::CAPTURE;
    return Co2Change::NO_CHANGE;
}

double co2Flow(double co2_ppm, double airflow_lps) {
    if (!std::isfinite(co2_ppm) || co2_ppm < 0.0) {
        throw EngineError(ErrorKind::INVALID_INPUT, "co2_ppm",
                          "CO2 concentration must be non-negative");
    }
    return co2_ppm * airflow_lps;
}

BalanceResult computeBalance(const StationReading& inlet, const StationReading& outlet,
                             const MoistAirState& inlet_state,
                             const MoistAirState& outlet_state,
                             const ProcessGeometry& geometry) {
    validateGeometry(geometry);

    BalanceResult b;
    b.mass_flow_kgs = outlet_state.density_kgm3 * geometry.airflow_lps * Conversions::LPS_TO_M3PS;

    b.energy_flux_inlet_w = inlet_state.enthalpy_jkg * b.mass_flow_kgs;
    b.energy_flux_outlet_w = outlet_state.enthalpy_jkg * b.mass_flow_kgs;
    b.energy_flux_change_w = b.energy_flux_outlet_w - b.energy_flux_inlet_w;

    b.co2_flow_inlet = co2Flow(inlet.co2_ppm, geometry.airflow_lps);
    b.co2_flow_outlet = co2Flow(outlet.co2_ppm, geometry.airflow_lps);
    b.co2_change = b.co2_flow_outlet - b.co2_flow_inlet;
    b.co2_classification = classifyCo2Change(b.co2_change);

    return b;
}

} // namespace MACB
