#pragma once

#include <cstdint>

namespace rendercore {

// SplitMix64 finalizer. Used as a stateless hash so that every generated
// element depends only on (seed, index), never on how the work was chunked.
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

class HashRng {
public:
    HashRng(std::uint64_t seed, std::uint64_t stream, std::uint64_t index)
        : state_(mix64(seed ^ mix64(stream ^ mix64(index)))) {}

    std::uint64_t nextU64() {
        state_ += 0x9E3779B97F4A7C15ull;
        return mix64(state_);
    }

    // Uniform in [0, 1).
    double nextUnit() {
        return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
    }

    double nextRange(double lo, double hi) {
        return lo + (hi - lo) * nextUnit();
    }

    std::uint32_t nextBelow(std::uint32_t bound) {
        return bound == 0 ? 0u : static_cast<std::uint32_t>(nextU64() % bound);
    }

private:
    std::uint64_t state_;
};

} // namespace rendercore
