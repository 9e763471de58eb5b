/**
 * @file ProcessGeometry.cpp
 * @brief Implementation of the chamber and resin-bed geometry
 */

#include "ProcessGeometry.hpp"
#include "EngineError.hpp"
#include "MACB.hpp"
#include <cmath>
#include <sstream>

namespace MACB {

namespace {

void requirePositive(double value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << "must be positive (got " << value << ")";
        throw EngineError(ErrorKind::INVALID_INPUT, field, oss.str());
    }
}

} // namespace

void validateGeometry(const ProcessGeometry& geometry) {
    requirePositive(geometry.airflow_lps, "airflow_lps");
    requirePositive(geometry.resin_diameter_mm, "resin_diameter_mm");
    requirePositive(geometry.resin_mass_kg, "resin_mass_kg");
    requirePositive(geometry.resin_density_kgm3, "resin_density_kgm3");
    requirePositive(geometry.chamber_diameter_mm, "chamber_diameter_mm");
}

DerivedGeometry deriveGeometry(const ProcessGeometry& geometry) {
    validateGeometry(geometry);

    DerivedGeometry d;

    // Chamber
    const double chamber_radius = 0.5 * geometry.chamber_diameter_mm * Conversions::MM_TO_M;
    d.chamber_area_m2 = M_PI * chamber_radius * chamber_radius;
    d.airflow_m3s = geometry.airflow_lps * Conversions::LPS_TO_M3PS;
    d.gas_velocity_ms = d.airflow_m3s / d.chamber_area_m2;

    // Single bead
    const double bead_diameter = geometry.resin_diameter_mm * Conversions::MM_TO_M;
    const double bead_radius = 0.5 * bead_diameter;
    d.bead_surface_area_m2 = M_PI * bead_diameter * bead_diameter;
    d.bead_volume_m3 = (4.0 / 3.0) * M_PI * bead_radius * bead_radius * bead_radius;

    // Bed
    d.resin_volume_m3 = geometry.resin_mass_kg / geometry.resin_density_kgm3;
    d.bead_count = d.resin_volume_m3 / d.bead_volume_m3;
    d.total_surface_area_m2 = d.bead_count * d.bead_surface_area_m2;

    return d;
}

} // namespace MACB
