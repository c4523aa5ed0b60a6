// src/core/pipeline.hpp
#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "errors.hpp"
#include "table.hpp"
#include "../stats/pooled_population.hpp"
#include "../stats/rescale.hpp"
#include "../stats/standardize.hpp"
#include "../types/numeric_text.hpp"

namespace betarank {

inline constexpr std::size_t metadata_columns = 2;

// ---------- data-quality observations (never failures) ----------
struct column_report {
    std::string name;
    std::size_t defined_in{0};       // defined raw values
    std::size_t blank_cells{0};      // empty / null-token cells
    std::size_t unparseable_cells{0};
    column_status status{column_status::ok};
    double mean{undefined};
    double stddev{undefined};
    std::vector<std::size_t> undefined_rows;  // 0-based rows undefined after transform
};

struct transform_report {
    std::size_t rows{0};
    std::size_t factor_columns{0};
    std::size_t pooled_size{0};
    std::size_t standardized_undefined{0};
    std::size_t transformed_undefined{0};
    std::vector<column_report> columns;

    std::size_t degenerate_columns() const {
        std::size_t n = 0;
        for (const auto& c : columns)
            if (c.status != column_status::ok) ++n;
        return n;
    }
};

struct transform_output {
    numeric_block standardized;
    numeric_block transformed;
};

struct run_result {
    result_table standardized;
    result_table transformed;
    transform_report report;
};

// ---------- numeric core ----------
inline numeric_block standardize_block(const numeric_block& raw,
                                       std::vector<standardized_column>* details = nullptr) {
    numeric_block z;
    z.rows = raw.rows;
    z.columns.reserve(raw.cols());
    if (details) details->clear();
    for (const auto& col : raw.columns) {
        standardized_column sc = standardize_column(col);
        z.columns.push_back(sc.values);
        if (details) details->push_back(std::move(sc));
    }
    return z;
}

/**
 * Standardize each column, pool every defined z-score, rank each cell against
 * the pool and rescale. Returns two blocks shaped like `raw`.
 */
inline transform_output transform(const numeric_block& raw,
                                  std::vector<standardized_column>* details = nullptr,
                                  std::size_t* pooled_size = nullptr) {
    transform_output out;
    out.standardized = standardize_block(raw, details);
    const pooled_population pool(out.standardized);
    if (pooled_size) *pooled_size = pool.size();
    out.transformed = rescale_block(rank_block(out.standardized, pool));
    return out;
}

// ---------- table-level orchestration ----------
inline void validate_shape(const input_table& in) {
    if (in.width() < metadata_columns + 1) {
        throw shape_error(fmt::format(
            "input needs at least 3 columns (entity id, name, one or more factors); got {}",
            in.width()));
    }
    for (std::size_t r = 0; r < in.rows.size(); ++r) {
        if (in.rows[r].size() != in.width()) {
            throw shape_error(fmt::format(
                "row {} has {} fields, header has {}", r + 1, in.rows[r].size(), in.width()));
        }
    }
}

inline result_table make_result(const input_table& in, numeric_block values) {
    result_table t;
    t.header = in.header;
    t.entity_ids.reserve(in.rows.size());
    t.entity_names.reserve(in.rows.size());
    for (const auto& row : in.rows) {
        t.entity_ids.push_back(row[0]);
        t.entity_names.push_back(row[1]);
    }
    t.values = std::move(values);
    return t;
}

/**
 * Run the full transformation over a text table.
 * Throws shape_error before doing any work if the table cannot be split into
 * metadata and factor columns. Everything else ends up as undefined cells.
 */
inline run_result run(const input_table& in) {
    validate_shape(in);

    const std::size_t rows = in.rows.size();
    const std::size_t factors = in.width() - metadata_columns;

    transform_report rep;
    rep.rows = rows;
    rep.factor_columns = factors;
    rep.columns.resize(factors);

    numeric_block raw(rows, factors);
    for (std::size_t c = 0; c < factors; ++c) {
        column_report& cr = rep.columns[c];
        cr.name = in.header[c + metadata_columns];
        for (std::size_t r = 0; r < rows; ++r) {
            const std::string& cell = in.rows[r][c + metadata_columns];
            switch (classify_cell(cell)) {
                case cell_kind::number:
                    raw.columns[c][r] = *parse_real(cell);
                    ++cr.defined_in;
                    break;
                case cell_kind::blank:       ++cr.blank_cells; break;
                case cell_kind::unparseable: ++cr.unparseable_cells; break;
            }
        }
    }

    std::vector<standardized_column> details;
    transform_output blocks = transform(raw, &details, &rep.pooled_size);

    for (std::size_t c = 0; c < factors; ++c) {
        column_report& cr = rep.columns[c];
        cr.status = details[c].status;
        cr.mean   = details[c].moments.mean;
        cr.stddev = details[c].moments.stddev;
        const column& xf = blocks.transformed.columns[c];
        for (std::size_t r = 0; r < rows; ++r)
            if (is_undefined(xf[r])) cr.undefined_rows.push_back(r);
    }
    rep.standardized_undefined = blocks.standardized.count_undefined();
    rep.transformed_undefined  = blocks.transformed.count_undefined();

    run_result res;
    res.standardized = make_result(in, std::move(blocks.standardized));
    res.transformed  = make_result(in, std::move(blocks.transformed));
    res.report = std::move(rep);
    return res;
}

}
