#ifndef ENGINE_ERROR_HPP
#define ENGINE_ERROR_HPP

/**
 * @file EngineError.hpp
 * @brief Typed error reporting for the psychrometric engine
 */

#include <stdexcept>
#include <string>

namespace MACB {

/**
 * @brief Category of an engine failure
 */
enum class ErrorKind {
    ALTITUDE_OUT_OF_RANGE,      ///< Altitude outside the standard atmosphere domain
    TEMPERATURE_OUT_OF_RANGE,   ///< Temperature outside the saturation correlation domain
    INVALID_INPUT,              ///< Out-of-domain humidity, pressure or geometry value
    CONVERGENCE_FAILURE         ///< Iterative solver exceeded its cap or lost its bracket
};

std::string toString(ErrorKind kind);

/**
 * @brief Exception thrown by every engine function on a domain error
 *
 * Carries the error kind and the name of the offending field. The
 * report builder extends the field into a dotted path ("inlet.dry_bulb_c")
 * when it re-throws.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& field, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const std::string& field() const { return field_; }
    const std::string& detail() const { return detail_; }

    /**
     * @brief Copy of this error with the field path prefixed by @p context
     */
    EngineError withContext(const std::string& context) const;

private:
    ErrorKind kind_;
    std::string field_;
    std::string detail_;

    static std::string buildMessage(ErrorKind kind, const std::string& field,
                                    const std::string& detail);
};

} // namespace MACB

#endif // ENGINE_ERROR_HPP
