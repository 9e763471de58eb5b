/**
 * @file psychro_table.cpp
 * @brief Moist-air property table at a site altitude
 *
 * Prints wet bulb, dew point, humidity ratio, enthalpy, specific volume
 * and density over a dry-bulb range at one relative humidity.
 *
 * Usage:
 *   ./macb_example <altitude> [rh_percent] [t_min] [t_max] [t_step]
 *
 * Examples:
 *   ./macb_example 0
 *   ./macb_example "1500 m" 40 -10 40 5
 *   ./macb_example "0.3 km" 80
 */

#include "EngineError.hpp"
#include "MoistAirProperties.hpp"
#include "StandardAtmosphere.hpp"
#include "UnitSystem.hpp"
#include <iostream>
#include <iomanip>
#include <string>

using namespace MACB;

void printHelp() {
    std::cout << "\n";
    std::cout << "MACB Psychrometric Table\n";
    std::cout << "========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  macb_example <altitude> [rh_percent] [t_min] [t_max] [t_step]\n\n";
    std::cout << "Altitude may carry a length unit (m, cm, mm, km); default m.\n";
    std::cout << "Defaults: rh 50 %, t_min 0 degC, t_max 40 degC, t_step 5 degC\n\n";
}

bool parseAltitude(const UnitSystem& units, const std::string& text, double& altitude_m) {
    double value;
    std::string unit;
    if (!units.parseValueWithUnit(text, value, unit)) {
        std::cerr << "Error: Cannot parse altitude '" << text << "'" << std::endl;
        return false;
    }
    if (unit.empty()) {
        altitude_m = value;
        return true;
    }
    try {
        altitude_m = units.convert(value, unit, "m");
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        printHelp();
        return argc < 2 ? 1 : 0;
    }

    UnitSystem units;
    double altitude;
    if (!parseAltitude(units, argv[1], altitude)) {
        return 1;
    }

    double rh = 50.0, t_min = 0.0, t_max = 40.0, t_step = 5.0;
    try {
        if (argc > 2) rh = std::stod(argv[2]);
        if (argc > 3) t_min = std::stod(argv[3]);
        if (argc > 4) t_max = std::stod(argv[4]);
        if (argc > 5) t_step = std::stod(argv[5]);
    } catch (const std::exception&) {
        std::cerr << "Error: Numeric arguments expected" << std::endl;
        return 1;
    }
    if (t_step <= 0.0 || t_max < t_min) {
        std::cerr << "Error: Need t_step > 0 and t_max >= t_min" << std::endl;
        return 1;
    }

    try {
        const double pressure = pressureFromAltitude(altitude);
        const MoistAirCalculator calculator;

        std::cout << "\nAltitude: " << altitude << " m, pressure: "
                  << std::fixed << std::setprecision(1) << pressure << " Pa, RH: "
                  << rh << " %\n\n";

        std::cout << std::setw(8) << "Tdb"
                  << std::setw(10) << "Twb"
                  << std::setw(10) << "Tdp"
                  << std::setw(12) << "W"
                  << std::setw(12) << "h"
                  << std::setw(10) << "v"
                  << std::setw(10) << "rho" << "\n";
        std::cout << std::setw(8) << "degC"
                  << std::setw(10) << "degC"
                  << std::setw(10) << "degC"
                  << std::setw(12) << "kg/kg"
                  << std::setw(12) << "kJ/kg"
                  << std::setw(10) << "m3/kg"
                  << std::setw(10) << "kg/m3" << "\n";
        std::cout << std::string(72, '-') << "\n";

        const int n_rows = static_cast<int>((t_max - t_min) / t_step + 1e-9) + 1;
        for (int i = 0; i < n_rows; ++i) {
            const double t = t_min + i * t_step;
            try {
                MoistAirState s = calculator.fromRelativeHumidity(t, rh, pressure);
                std::cout << std::setw(8) << std::setprecision(1) << t
                          << std::setw(10) << std::setprecision(2) << s.wet_bulb_c
                          << std::setw(10) << s.dew_point_c
                          << std::setw(12) << std::setprecision(6) << s.humidity_ratio
                          << std::setw(12) << std::setprecision(2) << s.enthalpy_jkg / 1000.0
                          << std::setw(10) << std::setprecision(4) << s.specific_volume_m3kg
                          << std::setw(10) << s.density_kgm3 << "\n";
            } catch (const EngineError& e) {
                std::cout << std::setw(8) << std::setprecision(1) << t
                          << "  " << e.what() << "\n";
            }
        }
        std::cout << "\n";
    } catch (const EngineError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
