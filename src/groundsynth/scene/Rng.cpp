#include "scene/Rng.hpp"

#include <limits>
#include <numeric>

namespace GS {

auto Rng::next() -> std::uint64_t {
    ++draws_;
    return engine_();
}

auto Rng::uniformInt(std::int64_t lo, std::int64_t hi) -> std::int64_t {
    if (lo >= hi)
        return lo;
    auto const span = static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo);
    if (span == std::numeric_limits<std::uint64_t>::max())
        return static_cast<std::int64_t>(next());
    auto const range = span + 1;
    // Reject the tail that would bias the modulo.
    auto const limit = std::numeric_limits<std::uint64_t>::max() - std::numeric_limits<std::uint64_t>::max() % range;
    std::uint64_t value = next();
    while (value >= limit)
        value = next();
    return lo + static_cast<std::int64_t>(value % range);
}

auto Rng::uniformIndex(std::size_t count) -> std::size_t {
    if (count <= 1)
        return 0;
    return static_cast<std::size_t>(uniformInt(0, static_cast<std::int64_t>(count) - 1));
}

auto Rng::uniformReal() -> double {
    // 53 high bits give a uniformly spaced double in [0, 1).
    return static_cast<double>(next() >> 11) * 0x1.0p-53;
}

auto Rng::bernoulli(double probability) -> bool {
    return uniformReal() < probability;
}

auto Rng::sampleWithoutReplacement(std::size_t n, std::size_t k) -> Expected<std::vector<std::size_t>> {
    if (k > n) {
        return std::unexpected(makeError(Error::Code::InvalidArgument,
                                         "cannot draw " + std::to_string(k) + " of " + std::to_string(n) + " items"));
    }
    std::vector<std::size_t> pool(n);
    std::iota(pool.begin(), pool.end(), std::size_t{0});
    for (std::size_t i = 0; i < k; ++i) {
        auto j = i + uniformIndex(n - i);
        std::swap(pool[i], pool[j]);
    }
    pool.resize(k);
    return pool;
}

} // namespace GS
