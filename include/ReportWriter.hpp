#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

/**
 * @file ReportWriter.hpp
 * @brief Text and CSV rendering of a ComparisonReport
 */

#include "ComparisonReport.hpp"
#include <ostream>
#include <string>

namespace MACB {

/**
 * @brief Output format selected on the command line
 */
enum class ReportFormat {
    TEXT,
    CSV
};

/**
 * @brief Parse "text" / "csv" (case-insensitive)
 * @throws EngineError INVALID_INPUT for anything else
 */
ReportFormat parseReportFormat(const std::string& name);

std::string fileExtension(ReportFormat format);

class ReportWriter {
public:
    /**
     * @brief Labelled listing: geometry, inlet, outlet, changes, CO2 line
     */
    static void writeText(const ComparisonReport& report, std::ostream& os);

    /**
     * @brief One row per station quantity: quantity,unit,inlet,outlet,change
     */
    static void writeCsv(const ComparisonReport& report, std::ostream& os);

    static void write(const ComparisonReport& report, ReportFormat format, std::ostream& os);

private:
    static void writeStation(const char* title, const StationReading& reading,
                             const MoistAirState& state, double co2_flow,
                             const char* co2_label, double energy_flux, std::ostream& os);
};

} // namespace MACB

#endif // REPORT_WRITER_HPP
