#pragma once

#include <cmath>
#include <cstddef>
#include <ranges>
#include <concepts>

namespace seqscope {

/**
 * @brief Small numeric helpers shared by the analyzers
 */
namespace stats {

/**
 * @brief Round half-up to @p decimals places
 *
 * Halves round towards positive infinity (0.125 -> 0.13, -0.5 -> 0).
 */
[[nodiscard]] inline double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    double rounded = std::floor(value * scale + 0.5) / scale;
    return rounded == 0.0 ? 0.0 : rounded;  // no negative zero
}

/**
 * @brief part / whole * 100, or 0 when whole is 0
 */
[[nodiscard]] inline double percentage(double part, double whole) noexcept {
    return whole > 0 ? part / whole * 100.0 : 0.0;
}

/**
 * @brief (a - b) / (a + b), or 0 when a + b is 0
 */
[[nodiscard]] inline double skew(double a, double b) noexcept {
    double sum = a + b;
    return sum != 0 ? (a - b) / sum : 0.0;
}

/**
 * @brief Compute mean of a range of values, 0 for an empty range
 */
template<std::ranges::range R>
    requires std::floating_point<std::ranges::range_value_t<R>> ||
             std::integral<std::ranges::range_value_t<R>>
[[nodiscard]] double mean(R&& values) {
    auto begin = std::ranges::begin(values);
    auto end = std::ranges::end(values);

    if (begin == end) return 0.0;

    double sum = 0.0;
    size_t count = 0;
    for (auto it = begin; it != end; ++it) {
        sum += static_cast<double>(*it);
        ++count;
    }

    return sum / count;
}

} // namespace stats
} // namespace seqscope
