// src/stats/percent_rank.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>

#include "../core/table.hpp"

namespace betarank {

/**
 * Exclusive percentile rank of x within an ascending population, matching the
 * spreadsheet PERCENTRANK.EXC convention.
 *
 *   n < 2, x < min or x > max   -> undefined
 *   x == min                    -> 1 / (n+1)
 *   x == max                    -> n / (n+1)
 *   otherwise                   -> (k + f) / (n+1)
 *
 * k is the number of population elements <= x (insert-to-the-right, so ties
 * land past the last equal element) and f interpolates linearly between
 * sorted[k-1] and sorted[k].
 *
 * @param sorted  population sorted ascending, NaN-free; duplicates allowed
 */
inline double exclusive_percent_rank(const std::vector<double>& sorted, double x) {
    const std::size_t n = sorted.size();
    if (n < 2 || is_undefined(x)) return undefined;
    if (x < sorted.front() || x > sorted.back()) return undefined;

    const double denom = static_cast<double>(n + 1);
    if (x == sorted.front()) return 1.0 / denom;
    if (x == sorted.back())  return static_cast<double>(n) / denom;

    // min < x < max, so 1 <= k <= n-1 and sorted[k-1] <= x < sorted[k]
    const auto it = std::upper_bound(sorted.begin(), sorted.end(), x);
    const std::size_t k = static_cast<std::size_t>(std::distance(sorted.begin(), it));
    const double lo = sorted[k - 1];
    const double hi = sorted[k];
    const double fraction = (x - lo) / (hi - lo);
    return (static_cast<double>(k) + fraction) / denom;
}

}
