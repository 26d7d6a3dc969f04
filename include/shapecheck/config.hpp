/**
 * @file config.hpp
 * @brief shapecheck compile-time configuration.
 *
 * Decoders compose primitive type tests into structural validators for
 * untyped JSON-like values and report every mismatch as a DecodeError tree.
 */

#ifndef SHAPECHECK_CONFIG_HPP
#define SHAPECHECK_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace shapecheck {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Separator placed between alternatives in generated expected labels
inline constexpr const char* ALTERNATIVE_SEPARATOR = " | ";

/** @} */

/**
 * @defgroup threading Threading Configuration
 *
 * Define SHAPECHECK_LAZY_SYNCHRONIZED=0 to drop the std::call_once guard
 * around the lazy() memo cell in single-threaded builds.
 * @{
 */
#ifndef SHAPECHECK_LAZY_SYNCHRONIZED
#define SHAPECHECK_LAZY_SYNCHRONIZED 1
#endif
/** @} */

} // namespace shapecheck

#endif // SHAPECHECK_CONFIG_HPP
