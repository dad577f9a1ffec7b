#pragma once

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace putman {

// ─── Deterministic RNG ─────────────────────────────────────────
// Seeded counter-based generator. Each draw adds a fixed odd
// increment to a 32-bit state and runs two multiply/xor-shift
// avalanche rounds over it. The stream is a pure function of
// (seed, call index); instances never share state.

class DeterministicRng {
public:
    explicit DeterministicRng(uint32_t seed) : state_(seed) {}

    /// Next value in [0, 1).
    double next();

    /// Integer in [0, n). Throws if n == 0.
    uint32_t intBelow(uint32_t n);

    /// Element of a non-empty sequence, chosen via intBelow(size).
    template <typename T>
    const T& pick(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::out_of_range("DeterministicRng::pick on empty sequence");
        }
        return items[intBelow(static_cast<uint32_t>(items.size()))];
    }

    /// Number of values drawn so far.
    uint64_t draws() const { return draws_; }

private:
    uint32_t state_;
    uint64_t draws_ = 0;
};

/// Clamp to the closed unit interval.
inline double clamp01(double value) {
    if (value < 0.0) return 0.0;
    if (value > 1.0) return 1.0;
    return value;
}

/// Round half up to 3 decimals. Every stored quantity in a run goes
/// through this.
double round3(double value);

} // namespace putman
