#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "MACB.hpp"
#include "ProcessGeometry.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <istream>

namespace MACB {

/**
 * @brief INI-style reader for process case files
 *
 * One file describes one snapshot: [geometry], [inlet], [outlet],
 * optional [solver] and [case]. Values may carry a unit ("25 L/s",
 * "0.7 mm"); they are converted to the unit the engine record expects.
 */
class ConfigReader {
public:
    /**
     * @brief Everything needed to build one comparison report
     */
    struct CaseConfig {
        std::string name;
        ProcessGeometry geometry;
        StationReading inlet;
        StationReading outlet;
        SolverSettings solver;
    };

    ConfigReader();

    /**
     * @brief Load configuration from file
     * @return false if the file cannot be opened
     */
    bool loadFile(const std::string& filename);

    /**
     * @brief Load configuration from an in-memory string
     */
    bool loadString(const std::string& text);

    // =========================================================================
    // Record Parsing (throws EngineError(INVALID_INPUT) naming section.key)
    // =========================================================================

    ProcessGeometry parseGeometry() const;
    StationReading parseStation(const std::string& section) const;

    /**
     * @brief [solver] section, falling back to defaults for absent keys
     */
    SolverSettings parseSolverSettings() const;

    std::string caseName(const std::string& fallback) const;

    CaseConfig parseCase(const std::string& fallback_name) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;

    /**
     * @brief Required numeric value, no unit allowed
     */
    double requireDouble(const std::string& section, const std::string& key) const;

    /**
     * @brief Required value converted to record_unit
     *
     * A bare number is taken to be in record_unit already.
     */
    double requireDoubleWithUnit(const std::string& section, const std::string& key,
                                 const std::string& record_unit) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    /**
     * @brief Write an annotated example case file
     * @return false if the file cannot be written
     */
    static bool generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& input);

    std::string trim(const std::string& str) const;
    std::string requireString(const std::string& section, const std::string& key) const;
    bool parseNumber(const std::string& text, double& value) const;
};

} // namespace MACB

#endif // CONFIG_READER_HPP
