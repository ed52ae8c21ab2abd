#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace GS {

/**
 * The single random stream of a generation run.
 *
 * Distributions are implemented here on top of the raw mt19937_64 output so that
 * a seed reproduces the same draws regardless of the standard library in use.
 * Every draw is counted; the count is recorded as scene lineage.
 */
class Rng {
public:
    explicit Rng(std::uint64_t seed)
        : seed_(seed), engine_(seed) {}

    Rng(Rng const&)                    = delete;
    auto operator=(Rng const&) -> Rng& = delete;
    Rng(Rng&&)                         = default;
    auto operator=(Rng&&) -> Rng&      = default;

    [[nodiscard]] auto seed() const -> std::uint64_t { return seed_; }
    [[nodiscard]] auto draws() const -> std::uint64_t { return draws_; }

    auto next() -> std::uint64_t;

    // Uniform over [lo, hi] inclusive; requires lo <= hi.
    auto uniformInt(std::int64_t lo, std::int64_t hi) -> std::int64_t;
    auto uniformIndex(std::size_t count) -> std::size_t;
    auto uniformReal() -> double;
    auto bernoulli(double probability) -> bool;

    // k distinct indices from [0, n) in draw order.
    auto sampleWithoutReplacement(std::size_t n, std::size_t k) -> Expected<std::vector<std::size_t>>;

    template <typename T>
    auto shuffle(std::vector<T>& values) -> void {
        if (values.size() < 2)
            return;
        for (std::size_t i = values.size() - 1; i > 0; --i) {
            auto j = uniformIndex(i + 1);
            using std::swap;
            swap(values[i], values[j]);
        }
    }

private:
    std::uint64_t   seed_;
    std::mt19937_64 engine_;
    std::uint64_t   draws_ = 0;
};

} // namespace GS
