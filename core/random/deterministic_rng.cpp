#include "random/deterministic_rng.hpp"
#include <cmath>

namespace putman {

namespace {
constexpr uint32_t kIncrement = 0x6d2b79f5u;
constexpr double kTwoPow32 = 4294967296.0;
}

double DeterministicRng::next() {
    state_ += kIncrement;
    uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    draws_++;
    return static_cast<double>(t ^ (t >> 14)) / kTwoPow32;
}

uint32_t DeterministicRng::intBelow(uint32_t n) {
    if (n == 0) {
        throw std::invalid_argument("DeterministicRng::intBelow requires n > 0");
    }
    return static_cast<uint32_t>(std::floor(next() * n));
}

double round3(double value) {
    return std::floor(value * 1000.0 + 0.5) / 1000.0;
}

} // namespace putman
