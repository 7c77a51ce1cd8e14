// secure_random.cpp
#include "breachguard/secure_random.hpp"

#include <random>    // For std::uniform_int_distribution
#include <stdexcept> // For std::runtime_error

#include <openssl/rand.h>

namespace breachguard {

auto SecureRandom::operator()() -> result_type {
    result_type value{0};
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) [[unlikely]] {
        throw std::runtime_error("RAND_bytes failed to produce random output");
    }
    return value;
}

auto SecureRandom::below(std::size_t bound) -> std::size_t {
    std::uniform_int_distribution<std::size_t> distribution{0, bound - 1};
    return distribution(*this);
}

} // namespace breachguard
