#ifndef ODMETA_RANDOM_UTILS_HPP
#define ODMETA_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to build unique temp names.
 */
namespace odmeta::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random string suffix for file and directory names.
     * @return A string representation of a random 64-bit integer.
     */
    std::string random_suffix();

} // namespace odmeta::RandomUtils

#endif // ODMETA_RANDOM_UTILS_HPP
