#include "utilities/stress_utils.hpp"
#include <algorithm>
#include <bitset>
#include <random>

namespace chunkvault {

std::vector<std::byte> generate_pseudo_random_data(std::size_t size,
                                                   unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);

    std::vector<std::byte> buffer(size);
    for (std::size_t i = 0; i < size; ++i) {
        buffer[i] = static_cast<std::byte>(dist(rng));
    }
    return buffer;
}

std::string generate_pseudo_random_string(std::size_t size, unsigned int seed) {
    std::vector<std::byte> bytes = generate_pseudo_random_data(size, seed);
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::size_t count_bit_errors(const std::vector<std::byte>& expected,
                             const std::vector<std::byte>& actual) {
    std::size_t errors = 0;

    std::size_t min_size = std::min(expected.size(), actual.size());
    for (std::size_t i = 0; i < min_size; ++i) {
        // XOR reveals all differing bits in the current byte.
        auto diff = std::to_integer<unsigned char>(expected[i] ^ actual[i]);
        errors += std::bitset<8>(diff).count();
    }

    std::size_t longer = std::max(expected.size(), actual.size());
    errors += (longer - min_size) * 8;
    return errors;
}

} // namespace chunkvault
