#ifndef QREPORT_RANDOM_UTILS_HPP
#define QREPORT_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Provides simple, thread-local random number utilities.
 *
 * Used to build unique names for temporary output files and test
 * directories. The underlying generator (std::mt19937_64) is thread-local.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random hexadecimal suffix for file names.
     * @return Sixteen lowercase hex digits.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // QREPORT_RANDOM_UTILS_HPP
