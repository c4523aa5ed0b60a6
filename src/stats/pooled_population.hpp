// src/stats/pooled_population.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

#include "../core/table.hpp"
#include "percent_rank.hpp"

namespace betarank {

// Cross-sectional population of every defined standardized value, across all
// columns. Sorted once at construction and read-only afterwards.
class pooled_population {
public:
    explicit pooled_population(const numeric_block& standardized) {
        std::size_t defined = 0;
        for (const auto& col : standardized.columns)
            for (double v : col)
                if (!is_undefined(v)) ++defined;

        sorted_.reserve(defined);
        for (const auto& col : standardized.columns)
            for (double v : col)
                if (!is_undefined(v)) sorted_.push_back(v);
        std::sort(sorted_.begin(), sorted_.end());
    }

    std::size_t size() const noexcept { return sorted_.size(); }
    bool rankable() const noexcept { return sorted_.size() >= 2; }
    const std::vector<double>& values() const noexcept { return sorted_; }

    double rank(double x) const { return exclusive_percent_rank(sorted_, x); }

private:
    std::vector<double> sorted_;
};

// Rank every cell against one shared pooled population. Same shape as input.
inline numeric_block rank_block(const numeric_block& standardized,
                                const pooled_population& pool) {
    numeric_block ranks(standardized.rows, standardized.cols());
    if (!pool.rankable()) return ranks;
    for (std::size_t c = 0; c < standardized.cols(); ++c) {
        const column& src = standardized.columns[c];
        column& dst = ranks.columns[c];
        for (std::size_t r = 0; r < src.size(); ++r) dst[r] = pool.rank(src[r]);
    }
    return ranks;
}

inline numeric_block pool_and_rank(const numeric_block& standardized) {
    const pooled_population pool(standardized);
    return rank_block(standardized, pool);
}

}
