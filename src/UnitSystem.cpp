#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace MACB {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto term = [&](const char* symbol, double exponent) {
        if (std::abs(exponent) < 1e-10) return;
        if (!first) ss << " ";
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    term("L", L);
    term("M", M);
    term("T", T);
    term("Theta", Theta);

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addMassUnits();
    addVolumeUnits();
    addVolumetricRateUnits();
    addDensityUnits();
    addPressureUnits();
    addTemperatureUnits();
}

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length"));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));
}

void UnitSystem::addMassUnits() {
    Dimension mass(0, 1, 0);

    registerUnit(Unit("kilogram", "kg", mass, 1.0, "mass"));
    registerUnit(Unit("gram", "g", mass, 0.001, "mass"));
}

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    Unit m3("cubic meter", "m3", volume, 1.0, "volume");
    m3.aliases = {"m^3"};
    registerUnit(m3);

    Unit liter("liter", "L", volume, 0.001, "volume");
    liter.aliases = {"litre"};
    registerUnit(liter);
}

void UnitSystem::addVolumetricRateUnits() {
    Dimension rate(3, 0, -1);

    Unit m3s("cubic meter per second", "m3/s", rate, 1.0, "volumetric_rate");
    m3s.aliases = {"m^3/s"};
    registerUnit(m3s);

    Unit lps("liter per second", "L/s", rate, 0.001, "volumetric_rate");
    lps.aliases = {"lps"};
    registerUnit(lps);

    registerUnit(Unit("cubic meter per hour", "m3/h", rate, 1.0 / 3600.0, "volumetric_rate"));

    Unit lpm("liter per minute", "L/min", rate, 0.001 / 60.0, "volumetric_rate");
    lpm.aliases = {"lpm"};
    registerUnit(lpm);
}

void UnitSystem::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density"));
    registerUnit(Unit("gram per cubic centimeter", "g/cm3", density, 1000.0, "density"));
}

void UnitSystem::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("hectopascal", "hPa", pressure, 100.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1000.0, "pressure"));
}

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));

    // 0 degC = 273.15 K
    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.offset = 273.15;
    celsius.aliases = {"C"};
    registerUnit(celsius);
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbol (case-sensitive primary, lowercase secondary)
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_[toLowerCase(unit.symbol)] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[toLowerCase(alias)] = unit;
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(key);
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    return to->convertFromBase(from->convertToBase(value));
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    size_t i = 0;
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Exponent, not the start of a unit symbol
            i += 2;
            while (i < trimmed.length() &&
                   std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
                i++;
            }
            break;
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(28) << std::left << u.name
                   << " [" << std::setw(6) << u.symbol << "] "
                   << " = " << u.to_base << " * base SI"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace MACB
