#ifndef BALANCE_CALCULATOR_HPP
#define BALANCE_CALCULATOR_HPP

/**
 * @file BalanceCalculator.hpp
 * @brief Mass, energy and CO2 balance between inlet and outlet stations
 */

#include "MACB.hpp"
#include "MoistAirProperties.hpp"
#include "ProcessGeometry.hpp"
#include <string>

namespace MACB {

/**
 * @brief Direction of the CO2 change across the bed
 */
enum class Co2Change {
    RELEASE,        ///< Outlet CO2 flow above inlet
    CAPTURE,        ///< Outlet CO2 flow below inlet
    NO_CHANGE       ///< Exactly equal
};

std::string toString(Co2Change change);

Co2Change classifyCo2Change(double co2_change);

struct BalanceResult {
    double mass_flow_kgs;           // Outlet density * airflow
    double energy_flux_inlet_w;     // h_in * mass flow
    double energy_flux_outlet_w;    // h_out * mass flow
    double energy_flux_change_w;    // outlet - inlet
    double co2_flow_inlet;          // ppm * L/s
    double co2_flow_outlet;         // ppm * L/s
    double co2_change;              // outlet - inlet
    Co2Change co2_classification;
};

/**
 * @brief CO2 flow proxy: concentration (ppm) times airflow (L/s)
 *
 * A proportionality carried over from the process sheet; no molar mass
 * or density correction is applied.
 */
double co2Flow(double co2_ppm, double airflow_lps);

/**
 * @brief Balance between two stations sharing one airflow
 *
 * The mass flow uses the outlet density for both energy fluxes.
 */
BalanceResult computeBalance(const StationReading& inlet, const StationReading& outlet,
                             const MoistAirState& inlet_state,
                             const MoistAirState& outlet_state,
                             const ProcessGeometry& geometry);

} // namespace MACB

#endif // BALANCE_CALCULATOR_HPP
