#include "ConfigReader.hpp"
#include "EngineError.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cmath>
#include <limits>

namespace MACB {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream input(text);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        if (hasKey(current_section, key)) {
            std::cerr << "Warning: Duplicate key [" << current_section << "]:" << key
                      << " at line " << line_num << ", keeping the last value" << std::endl;
        }
        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool ConfigReader::parseNumber(const std::string& text, double& value) const {
    std::string s = trim(text);
    if (s.empty()) return false;
    try {
        size_t consumed = 0;
        value = std::stod(s, &consumed);
        return consumed == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

std::string ConfigReader::requireString(const std::string& section,
                                        const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        throw EngineError(ErrorKind::INVALID_INPUT, section + "." + key,
                          "missing required value");
    }
    return val;
}

double ConfigReader::requireDouble(const std::string& section, const std::string& key) const {
    std::string val = requireString(section, key);
    double value;
    if (!parseNumber(val, value)) {
        throw EngineError(ErrorKind::INVALID_INPUT, section + "." + key,
                          "'" + val + "' is not a number");
    }
    return value;
}

double ConfigReader::requireDoubleWithUnit(const std::string& section, const std::string& key,
                                           const std::string& record_unit) const {
    std::string val = requireString(section, key);

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        throw EngineError(ErrorKind::INVALID_INPUT, section + "." + key,
                          "'" + val + "' is not a number");
    }

    if (parsed_unit.empty() || parsed_unit == record_unit) {
        return parsed_value;
    }

    try {
        return unit_system_.convert(parsed_value, parsed_unit, record_unit);
    } catch (const std::runtime_error& e) {
        throw EngineError(ErrorKind::INVALID_INPUT, section + "." + key, e.what());
    }
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Record Parsing
// =============================================================================

ProcessGeometry ConfigReader::parseGeometry() const {
    ProcessGeometry g;
    g.altitude_m = requireDoubleWithUnit("geometry", "altitude", "m");
    g.airflow_lps = requireDoubleWithUnit("geometry", "airflow", "L/s");
    g.resin_diameter_mm = requireDoubleWithUnit("geometry", "resin_diameter", "mm");
    g.resin_mass_kg = requireDoubleWithUnit("geometry", "resin_mass", "kg");
    g.resin_density_kgm3 = requireDoubleWithUnit("geometry", "resin_density", "kg/m3");
    g.chamber_diameter_mm = requireDoubleWithUnit("geometry", "chamber_diameter", "mm");
    return g;
}

StationReading ConfigReader::parseStation(const std::string& section) const {
    StationReading r;
    r.dry_bulb_c = requireDoubleWithUnit(section, "dry_bulb", "degC");
    r.relative_humidity_pct = requireDouble(section, "relative_humidity");
    r.co2_ppm = requireDouble(section, "co2");
    return r;
}

SolverSettings ConfigReader::parseSolverSettings() const {
    SolverSettings s;
    if (hasKey("solver", "temperature_tolerance")) {
        s.temperature_tolerance = requireDouble("solver", "temperature_tolerance");
    }
    if (hasKey("solver", "humidity_ratio_tolerance")) {
        s.humidity_ratio_tolerance = requireDouble("solver", "humidity_ratio_tolerance");
    }
    if (hasKey("solver", "max_iterations")) {
        double n = requireDouble("solver", "max_iterations");
        if (n != std::floor(n) || std::abs(n) > std::numeric_limits<int>::max()) {
            throw EngineError(ErrorKind::INVALID_INPUT, "solver.max_iterations",
                              "must be an integer");
        }
        s.max_iterations = static_cast<int>(n);
    }

    try {
        s.validate();
    } catch (const EngineError& e) {
        throw e.withContext("solver");
    }
    return s;
}

std::string ConfigReader::caseName(const std::string& fallback) const {
    return getString("case", "name", fallback);
}

ConfigReader::CaseConfig ConfigReader::parseCase(const std::string& fallback_name) const {
    CaseConfig c;
    c.name = caseName(fallback_name);
    c.geometry = parseGeometry();
    c.inlet = parseStation("inlet");
    c.outlet = parseStation("outlet");
    c.solver = parseSolverSettings();
    return c;
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write configuration template: " << filename << std::endl;
        return false;
    }

    file << "# MACB Case File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value [unit]\n";
    file << "# A value without a unit is read in the unit shown here\n\n";

    file << "[case]\n";
    file << "name = bed_a_morning\n\n";

    file << "[geometry]\n";
    file << "altitude = 1500 m                  # -5000 .. 11000 m\n";
    file << "airflow = 25 L/s                   # also m3/s, m3/h, L/min\n";
    file << "resin_diameter = 0.7 mm\n";
    file << "resin_mass = 2.5 kg\n";
    file << "resin_density = 1100 kg/m3\n";
    file << "chamber_diameter = 150 mm\n\n";

    file << "[inlet]\n";
    file << "dry_bulb = 25 degC                 # also K\n";
    file << "relative_humidity = 50             # percent, 0 .. 100\n";
    file << "co2 = 800                          # ppm\n\n";

    file << "[outlet]\n";
    file << "dry_bulb = 27.5 degC\n";
    file << "relative_humidity = 38\n";
    file << "co2 = 420\n\n";

    file << "[solver]\n";
    file << "# Optional, defaults shown\n";
    file << "temperature_tolerance = 1e-4       # degC\n";
    file << "humidity_ratio_tolerance = 1e-5    # kg/kg\n";
    file << "max_iterations = 100\n";

    return static_cast<bool>(file);
}

} // namespace MACB
