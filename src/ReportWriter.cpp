/**
 * @file ReportWriter.cpp
 * @brief Text and CSV rendering of a ComparisonReport
 */

#include "ReportWriter.hpp"
#include "EngineError.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>

namespace MACB {

namespace {

constexpr int REPORT_PRECISION = 10;

struct CsvRow {
    const char* quantity;
    const char* unit;
    double inlet;
    double outlet;
};

} // namespace

ReportFormat parseReportFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text" || lower == "txt") return ReportFormat::TEXT;
    if (lower == "csv") return ReportFormat::CSV;
    throw EngineError(ErrorKind::INVALID_INPUT, "format",
                      "unknown report format '" + name + "' (text, csv)");
}

std::string fileExtension(ReportFormat format) {
    return format == ReportFormat::CSV ? "csv" : "txt";
}

// =============================================================================
// Text
// =============================================================================

void ReportWriter::writeStation(const char* title, const StationReading& reading,
                                const MoistAirState& state, double co2_flow,
                                const char* co2_label, double energy_flux,
                                std::ostream& os) {
    os << title << " Data Set:\n";
    os << "Dry Bulb Temperature: " << reading.dry_bulb_c << " °C\n";
    os << "Relative Humidity: " << reading.relative_humidity_pct << " %\n";
    os << "CO2 Level: " << reading.co2_ppm << "\n";
    os << "Wet Bulb Temperature: " << state.wet_bulb_c << " °C\n";
    os << "Humidity Ratio: " << state.humidity_ratio << " kg/kg\n";
    os << "Dew Point Temperature: " << state.dew_point_c << " °C\n";
    os << "Relative Humidity (Calculated): " << state.relative_humidity_pct << " %\n";
    os << "Partial Pressure: " << state.vapor_pressure_pa << " Pa\n";
    os << "Moist Air Enthalpy: " << state.enthalpy_jkg << " J/kg\n";
    os << "Specific Volume: " << state.specific_volume_m3kg << " m³/kg\n";
    os << "Degree of Saturation: " << state.degree_of_saturation << "\n";
    os << "Dry Air Enthalpy: " << state.dry_air_enthalpy_jkg << " J/kg\n";
    os << "Air Density: " << state.density_kgm3 << " kg/m³\n";
    os << "CO2 Flow (" << co2_label << "): " << co2_flow << " mg/s\n";
    os << "Energy Flux: " << energy_flux << " J/s\n";
    os << "\n";
}

void ReportWriter::writeText(const ComparisonReport& report, std::ostream& os) {
    const std::streamsize old_precision = os.precision(REPORT_PRECISION);

    const ProcessGeometry& p = report.process;
    const DerivedGeometry& g = report.geometry;
    const BalanceResult& b = report.balance;
    const MoistAirDelta& d = report.delta;

    os << "Altitude: " << p.altitude_m << " m\n";
    os << "Atmospheric Pressure: " << report.pressure_pa << " Pa\n";
    os << "Air Flow: " << p.airflow_lps << " L/s\n";
    os << "Air Flow: " << g.airflow_m3s << " m³/s\n";
    os << "\n";
    os << "Chamber Diameter: " << p.chamber_diameter_mm << " mm\n";
    os << "Chamber Area: " << g.chamber_area_m2 * 1.0e4 << " cm²\n";
    os << "Chamber Area: " << g.chamber_area_m2 << " m²\n";
    os << "Gas Speed in Chamber: " << g.gas_velocity_ms << " m/s\n";
    os << "Gas Speed in Chamber: " << g.gas_velocity_ms * 100.0 << " cm/s\n";
    os << "\n";
    os << "Resin Diameter: " << p.resin_diameter_mm << " mm\n";
    os << "Resin Mass: " << p.resin_mass_kg << " kg\n";
    os << "Resin Density: " << p.resin_density_kgm3 << " kg/m³\n";
    os << "Single Sphere Surface Area: " << g.bead_surface_area_m2 << " m²\n";
    os << "Single Sphere Volume: " << g.bead_volume_m3 << " m³\n";
    os << "Total Resin Volume: " << g.resin_volume_m3 << " m³\n";
    os << "Rough Number of Spheres: " << g.bead_count << "\n";
    os << "Total Surface Area: " << g.total_surface_area_m2 << " m²\n";
    os << "Mass Flow: " << b.mass_flow_kgs << " kg/s\n";
    os << "\n";

    writeStation("Inlet", report.inlet_reading, report.inlet, b.co2_flow_inlet, "Inlet",
                 b.energy_flux_inlet_w, os);
    writeStation("Outlet", report.outlet_reading, report.outlet, b.co2_flow_outlet, "Outlet",
                 b.energy_flux_outlet_w, os);

    os << "Changes:\n";
    os << "Dry Bulb Temperature Change: " << d.dry_bulb_c << " °C\n";
    os << "Relative Humidity Change: " << d.input_relative_humidity_pct << " %\n";
    os << "CO2 Level Change: " << d.co2_ppm << "\n";
    os << "Wet Bulb Temperature Change: " << d.wet_bulb_c << " °C\n";
    os << "Humidity Ratio Change: " << d.humidity_ratio << " kg/kg\n";
    os << "Dew Point Temperature Change: " << d.dew_point_c << " °C\n";
    os << "Relative Humidity (Calculated) Change: " << d.relative_humidity_pct << " %\n";
    os << "Partial Pressure Change: " << d.vapor_pressure_pa << " Pa\n";
    os << "Moist Air Enthalpy Change: " << d.enthalpy_jkg << " J/kg\n";
    os << "Specific Volume Change: " << d.specific_volume_m3kg << " m³/kg\n";
    os << "Degree of Saturation Change: " << d.degree_of_saturation << "\n";
    os << "Dry Air Enthalpy Change: " << d.dry_air_enthalpy_jkg << " J/kg\n";
    os << "Air Density Change: " << d.density_kgm3 << " kg/m³\n";
    os << "Energy Flux Change: " << b.energy_flux_change_w << " J/s\n";
    os << toString(b.co2_classification) << ": " << b.co2_change << " mg/s\n";

    os.precision(old_precision);
}

// =============================================================================
// CSV
// =============================================================================

void ReportWriter::writeCsv(const ComparisonReport& report, std::ostream& os) {
    const std::streamsize old_precision = os.precision(REPORT_PRECISION);

    const StationReading& ri = report.inlet_reading;
    const StationReading& ro = report.outlet_reading;
    const MoistAirState& si = report.inlet;
    const MoistAirState& so = report.outlet;
    const BalanceResult& b = report.balance;

    const CsvRow rows[] = {
        {"dry_bulb_temperature", "degC", ri.dry_bulb_c, ro.dry_bulb_c},
        {"relative_humidity", "%", ri.relative_humidity_pct, ro.relative_humidity_pct},
        {"co2_level", "ppm", ri.co2_ppm, ro.co2_ppm},
        {"wet_bulb_temperature", "degC", si.wet_bulb_c, so.wet_bulb_c},
        {"humidity_ratio", "kg/kg", si.humidity_ratio, so.humidity_ratio},
        {"dew_point_temperature", "degC", si.dew_point_c, so.dew_point_c},
        {"relative_humidity_calculated", "%", si.relative_humidity_pct, so.relative_humidity_pct},
        {"partial_pressure", "Pa", si.vapor_pressure_pa, so.vapor_pressure_pa},
        {"moist_air_enthalpy", "J/kg", si.enthalpy_jkg, so.enthalpy_jkg},
        {"specific_volume", "m3/kg", si.specific_volume_m3kg, so.specific_volume_m3kg},
        {"degree_of_saturation", "", si.degree_of_saturation, so.degree_of_saturation},
        {"dry_air_enthalpy", "J/kg", si.dry_air_enthalpy_jkg, so.dry_air_enthalpy_jkg},
        {"air_density", "kg/m3", si.density_kgm3, so.density_kgm3},
        {"co2_flow", "mg/s", b.co2_flow_inlet, b.co2_flow_outlet},
        {"energy_flux", "J/s", b.energy_flux_inlet_w, b.energy_flux_outlet_w},
    };

    os << "quantity,unit,inlet,outlet,change\n";
    for (const auto& row : rows) {
        os << row.quantity << "," << row.unit << "," << row.inlet << ","
           << row.outlet << "," << (row.outlet - row.inlet) << "\n";
    }

    os.precision(old_precision);
}

void ReportWriter::write(const ComparisonReport& report, ReportFormat format,
                         std::ostream& os) {
    switch (format) {
        case ReportFormat::TEXT: writeText(report, os); break;
        case ReportFormat::CSV:  writeCsv(report, os); break;
    }
}

} // namespace MACB
