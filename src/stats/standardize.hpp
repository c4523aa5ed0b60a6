// src/stats/standardize.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <vector>

#include "../core/table.hpp"

namespace betarank {

enum class column_status { ok, too_few_values, zero_stddev, nonfinite_stddev };

inline const char* to_string(column_status s) {
    switch (s) {
        case column_status::too_few_values: return "fewer than 2 values";
        case column_status::zero_stddev:    return "zero standard deviation";
        case column_status::nonfinite_stddev: return "non-finite standard deviation";
        default:                            return "ok";
    }
}

// Two-pass moments over the defined entries of one column (ddof = 1).
struct column_moments {
    std::size_t count{0};
    double mean{0.0};
    double stddev{undefined};

    column_status status() const {
        if (count < 2) return column_status::too_few_values;
        if (!std::isfinite(mean) || !std::isfinite(stddev)) return column_status::nonfinite_stddev;
        if (!(stddev > 0.0)) return column_status::zero_stddev;
        return column_status::ok;
    }
};

inline column_moments compute_moments(const column& values) {
    column_moments m;
    double sum = 0.0;
    for (double v : values) {
        if (is_undefined(v)) continue;
        ++m.count;
        sum += v;
    }
    if (m.count == 0) { m.mean = undefined; return m; }
    m.mean = sum / static_cast<double>(m.count);
    if (m.count < 2) return m;

    double ss = 0.0;
    for (double v : values) {
        if (is_undefined(v)) continue;
        const double d = v - m.mean;
        ss += d * d;
    }
    m.stddev = std::sqrt(ss / static_cast<double>(m.count - 1));
    return m;
}

struct standardized_column {
    column values;
    column_moments moments;
    column_status status{column_status::ok};
};

// z-score one column. Degenerate columns come back entirely undefined.
inline standardized_column standardize_column(const column& values) {
    standardized_column out;
    out.moments = compute_moments(values);
    out.status  = out.moments.status();
    out.values.assign(values.size(), undefined);
    if (out.status != column_status::ok) return out;

    const double mu = out.moments.mean;
    const double sd = out.moments.stddev;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!is_undefined(values[i])) out.values[i] = (values[i] - mu) / sd;
    }
    return out;
}

}
