#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>
#include <ostream>

namespace MACB {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature (L M T Θ)
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temp = 0)
        : L(length), M(mass), T(time), Theta(temp) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units
 *
 * Base units: meter, kilogram, second, kelvin.
 * base = (value + offset) * to_base
 */
struct Unit {
    std::string name;
    std::string symbol;
    Dimension dimension;
    double to_base;
    double offset;
    std::string category;
    std::vector<std::string> aliases;

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}

    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief SI unit database for the quantities found in process files
 *
 * Covers length, mass, volume, volumetric rate, density, pressure and
 * temperature. Parses strings such as "25 L/s", "0.7 mm" or "298.15 K".
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name or symbol
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    std::vector<std::string> getCategories() const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;

    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "value unit" into its parts
     * @param[out] value Numeric part as written (not converted)
     * @param[out] unit Unit part, empty if none was given
     * @return false if no leading number is present
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    /**
     * @brief Print unit database to stream
     */
    void printDatabase(std::ostream& os) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    void initializeDatabase();

    void addLengthUnits();
    void addMassUnits();
    void addVolumeUnits();
    void addVolumetricRateUnits();
    void addDensityUnits();
    void addPressureUnits();
    void addTemperatureUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

} // namespace MACB

#endif // UNIT_SYSTEM_HPP
