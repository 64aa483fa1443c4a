/**
 * @file Errors.hpp
 * @brief Centralized error handling utilities.
 *
 * Provides the exception types raised by the library and a macro for
 * runtime error checking that can be disabled at compile-time with the
 * CADENCE_DISABLE_ERROR_CHECKS flag.
 */
#ifndef CADENCE_ERRORS_HPP
#define CADENCE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cadence
{

/**
 * @brief nan error class for cadence library.
 */
class nan_error : public std::invalid_argument
{
public:
    explicit nan_error(const std::string& message)
        : std::invalid_argument("NaN Error: " + message) {}
};

/**
 * @brief Validation error class for cadence library.
 * Used to signal invalid inputs or arguments.
 */
class validation_error : public std::invalid_argument
{
public:
    explicit validation_error(const std::string& message)
        : std::invalid_argument("Validation Error: " + message) {}
};

/**
 * @brief Bounds error class for cadence library.
 * Used to signal index out-of-range or size overflow.
 */
class bounds_error : public std::out_of_range
{
public:
    explicit bounds_error(const std::string& message)
        : std::out_of_range("Bounds Error: " + message) {}
};

/**
 * @brief Device-side error class for cadence library.
 * Used to signal allocation or execution failures on the SYCL device.
 */
class device_error : public std::runtime_error
{
public:
    explicit device_error(const std::string& message)
        : std::runtime_error("Device Error: " + message) {}
};

} // namespace cadence

/**
 * @brief Error checking macro.
 *
 * Evaluates a condition and throws the specified exception type
 * with the given message if the condition is true.
 * Can be disabled at compile-time with CADENCE_DISABLE_ERROR_CHECKS.
 *
 * @param condition The condition to check (throws if true)
 * @param exception_type The exception type to throw
 * @param message The error message
 *
 * Usage:
 *   CADENCE_CHECK(batch_size == 0, validation_error, "batch size is zero");
 */
#ifndef CADENCE_DISABLE_ERROR_CHECKS
  #define CADENCE_CHECK(condition, exception_type, message) \
   do \
   { \
      if (condition) \
      { \
         throw exception_type(message); \
      } \
   } while(0)
#else
  #define CADENCE_CHECK(condition, exception_type, message) ((void)0)
#endif

/**
 * @brief Device-side error checking macro.
 *
 * Evaluates a condition inside a SYCL kernel and, if true:
 *   - atomically sets an error flag to the specified error code
 *   - immediately returns from the current work-item
 *
 * The first code written wins; later failures leave it untouched.
 * When CADENCE_DISABLE_ERROR_CHECKS is defined, the macro does nothing.
 *
 * @param condition The condition to evaluate
 * @param p_err Pointer to an int32_t error flag in shared/device memory
 * @param code Error code to atomically set when condition is true
 *
 * Usage inside a SYCL kernel:
 *   CADENCE_DEVICE_CHECK(src_row >= num_rows, p_error, 1);
 */
#ifndef CADENCE_DISABLE_ERROR_CHECKS
  #define CADENCE_DEVICE_CHECK(condition, p_err, code) \
    do \
    { \
        if (condition) \
        { \
            auto atomic_err = sycl::atomic_ref<int32_t, \
                sycl::memory_order::relaxed, \
                sycl::memory_scope::device, \
                sycl::access::address_space::global_space>(*p_err); \
            int32_t expected = 0; \
            atomic_err.compare_exchange_strong(expected, code); \
            return; \
        } \
    } while (0)
#else
  #define CADENCE_DEVICE_CHECK(condition, p_err, code) ((void)0)
#endif

#endif // CADENCE_ERRORS_HPP
