#ifndef CHUNKVAULT_STRESS_UTILS_HPP
#define CHUNKVAULT_STRESS_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

// Helpers shared by the tests that push file content through the write and
// read paths.

namespace chunkvault {

/**
 * @brief Generate deterministic pseudo-random bytes.
 *
 * Uses a Mersenne Twister so runs are reproducible across platforms.
 *
 * @param size  Number of bytes to generate.
 * @param seed  Seed value for the generator.
 */
std::vector<std::byte> generate_pseudo_random_data(std::size_t size,
                                                   unsigned int seed = 0xDEADBEEF);

/// Same bytes as generate_pseudo_random_data, as a string for stringstreams.
std::string generate_pseudo_random_string(std::size_t size,
                                          unsigned int seed = 0xDEADBEEF);

/**
 * @brief Count differing bits between two buffers.
 *
 * Bytes present in only one buffer count as eight differing bits each.
 */
std::size_t count_bit_errors(const std::vector<std::byte>& expected,
                             const std::vector<std::byte>& actual);

} // namespace chunkvault

#endif // CHUNKVAULT_STRESS_UTILS_HPP
