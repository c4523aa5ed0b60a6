// src/stats/rescale.hpp
#pragma once
#include "../core/table.hpp"

namespace betarank {

// Fixed output contract: score = (percentile - 50.5) / 34, percentile on 0..100.
// Downstream consumers validate against these exact constants.
inline constexpr double rescale_center = 50.5;
inline constexpr double rescale_width  = 34.0;

inline double rescale(double rank01) {
    if (is_undefined(rank01)) return undefined;
    return (rank01 * 100.0 - rescale_center) / rescale_width;
}

inline numeric_block rescale_block(const numeric_block& ranks) {
    numeric_block out(ranks.rows, ranks.cols());
    for (std::size_t c = 0; c < ranks.cols(); ++c)
        for (std::size_t r = 0; r < ranks.rows; ++r)
            out.columns[c][r] = rescale(ranks.columns[c][r]);
    return out;
}

}
