#ifndef BALLOON_CORE_SEEDED_RANDOM_H
#define BALLOON_CORE_SEEDED_RANDOM_H

#include <cmath>
#include <cstdint>

namespace balloon {

// Sine-hash generator. The sequence is a fixed function of the seed so
// randomized silhouettes can be recomputed on every frame.
class SeededRandom {
public:
    explicit SeededRandom(std::int64_t seed) noexcept : state_(seed) {}

    // Next value in [0, 1).
    double next() noexcept {
        const double x = std::sin(static_cast<double>(state_++)) * 10000.0;
        return x - std::floor(x);
    }

    // Next value in [lo, hi).
    double range(double lo, double hi) noexcept { return lo + next() * (hi - lo); }

private:
    std::int64_t state_;
};

} // namespace balloon

#endif // BALLOON_CORE_SEEDED_RANDOM_H
