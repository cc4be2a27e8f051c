#pragma once

#include "tempora/expected.hpp"

#include <cstdint>

namespace tempora {

/**
 * @brief Failure kinds reported by fallible tempora operations
 *
 * Mixing time points of different clocks is not a runtime condition: there is
 * no operator for it, so such code does not compile.
 */
enum class TimeError : uint8_t {
    invalid_period,         ///< Zero/negative denominator or non-positive numerator
    overflow,               ///< Result or rescaled operand exceeds the tick range
    invalid_calendar_field, ///< Year/month/day combination is not a calendar date
    division_by_zero,       ///< Scalar or duration divisor is zero
    unsorted_leap_table     ///< Leap second insertions are not strictly increasing
};

/**
 * @brief Get a human-readable error message
 * @return Static string describing the error
 */
[[nodiscard]] constexpr const char* time_error_string(TimeError e) noexcept {
    switch (e) {
        case TimeError::invalid_period:
            return "Invalid tick period";
        case TimeError::overflow:
            return "Tick count out of range";
        case TimeError::invalid_calendar_field:
            return "Invalid calendar field combination";
        case TimeError::division_by_zero:
            return "Division by zero";
        case TimeError::unsorted_leap_table:
            return "Leap second insertions not strictly increasing";
    }
    return "Unknown time error";
}

/**
 * @brief Result type for every fallible tempora operation
 *
 * Alias for expected<T, TimeError>. No operation in the library aborts,
 * throws or wraps silently; failures are always returned through this type.
 *
 * @tparam T The type of the successfully computed value
 */
template <typename T>
using TimeResult = expected<T, TimeError>;

/**
 * @brief Factory function for creating time errors
 *
 * Usage:
 * @code
 *   if (divisor == 0) {
 *       return make_time_error(TimeError::division_by_zero);
 *   }
 * @endcode
 */
constexpr auto make_time_error(TimeError code) noexcept {
    return unexpected<TimeError>(code);
}

} // namespace tempora
