/**
 * @file EngineError.cpp
 * @brief Implementation of engine error types and solver settings validation
 */

#include "EngineError.hpp"
#include "MACB.hpp"
#include <cmath>
#include <sstream>

namespace MACB {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ALTITUDE_OUT_OF_RANGE:    return "AltitudeOutOfRange";
        case ErrorKind::TEMPERATURE_OUT_OF_RANGE: return "TemperatureOutOfRange";
        case ErrorKind::INVALID_INPUT:            return "InvalidInput";
        case ErrorKind::CONVERGENCE_FAILURE:      return "ConvergenceFailure";
    }
    return "Unknown";
}

EngineError::EngineError(ErrorKind kind, const std::string& field, const std::string& detail)
    : std::runtime_error(buildMessage(kind, field, detail)),
      kind_(kind), field_(field), detail_(detail) {}

EngineError EngineError::withContext(const std::string& context) const {
    if (context.empty()) return *this;
    std::string path = field_.empty() ? context : context + "." + field_;
    return EngineError(kind_, path, detail_);
}

std::string EngineError::buildMessage(ErrorKind kind, const std::string& field,
                                      const std::string& detail) {
    std::ostringstream oss;
    oss << "[" << toString(kind) << "]";
    if (!field.empty()) oss << " " << field << ":";
    oss << " " << detail;
    return oss.str();
}

// =============================================================================
// SolverSettings
// =============================================================================

void SolverSettings::validate() const {
    if (!std::isfinite(temperature_tolerance) || temperature_tolerance <= 0.0 ||
        temperature_tolerance > 0.1) {
        throw EngineError(ErrorKind::INVALID_INPUT, "temperature_tolerance",
                          "must lie in (0, 0.1] degC");
    }
    if (!std::isfinite(humidity_ratio_tolerance) || humidity_ratio_tolerance <= 0.0 ||
        humidity_ratio_tolerance > 1e-3) {
        throw EngineError(ErrorKind::INVALID_INPUT, "humidity_ratio_tolerance",
                          "must lie in (0, 1e-3] kg/kg");
    }
    if (max_iterations < 1 || max_iterations > 10000) {
        throw EngineError(ErrorKind::INVALID_INPUT, "max_iterations",
                          "must lie in [1, 10000]");
    }
}

} // namespace MACB
