#ifndef PROCESS_GEOMETRY_HPP
#define PROCESS_GEOMETRY_HPP

/**
 * @file ProcessGeometry.hpp
 * @brief Fixed-bed and chamber geometry of the air-handling process
 */

namespace MACB {

/**
 * @brief Site and bed description, in the units the process sheet uses
 */
struct ProcessGeometry {
    double altitude_m;              // Site altitude (m), may be negative
    double airflow_lps;             // Volumetric airflow (L/s)
    double resin_diameter_mm;       // Resin bead diameter (mm)
    double resin_mass_kg;           // Resin charge (kg)
    double resin_density_kgm3;      // Resin density (kg/m³)
    double chamber_diameter_mm;     // Chamber inner diameter (mm)
};

/**
 * @brief Quantities derived from ProcessGeometry, SI units
 *
 * bead_count is a uniform-sphere estimate (total resin volume divided by
 * the volume of one bead, ignoring packing voids and size spread), not a
 * measured count. total_surface_area_m2 inherits the same approximation.
 */
struct DerivedGeometry {
    double chamber_area_m2;         // Chamber cross-section
    double airflow_m3s;             // Volumetric airflow
    double gas_velocity_ms;         // Superficial gas velocity in the chamber
    double bead_surface_area_m2;    // Surface of a single bead
    double bead_volume_m3;          // Volume of a single bead
    double resin_volume_m3;         // Total resin volume, mass / density
    double bead_count;              // Estimated number of beads
    double total_surface_area_m2;   // bead_count * bead_surface_area_m2
};

/**
 * @brief Throw INVALID_INPUT naming the first non-positive or non-finite field
 *
 * Altitude is not checked here; the standard atmosphere owns its domain.
 */
void validateGeometry(const ProcessGeometry& geometry);

/**
 * @brief Derive chamber and bed quantities
 * @throws EngineError INVALID_INPUT for non-positive airflow, diameters, mass or density
 */
DerivedGeometry deriveGeometry(const ProcessGeometry& geometry);

} // namespace MACB

#endif // PROCESS_GEOMETRY_HPP
