/**
 * @file random_utils.hpp
 * @brief Thread-local random helpers used to build unique temp names.
 */

#ifndef DISCPACK_RANDOM_UTILS_HPP
#define DISCPACK_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Simple, thread-local random number utilities.
 *
 * The underlying generator (std::mt19937_64) is thread-local, so callers
 * never share state.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random lowercase hex suffix of 16 characters.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // DISCPACK_RANDOM_UTILS_HPP
