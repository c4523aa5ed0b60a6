// src/core/table.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace betarank {

// Undefined cells are quiet NaN throughout the pipeline.
inline constexpr double undefined = std::numeric_limits<double>::quiet_NaN();

inline bool is_undefined(double v) noexcept { return std::isnan(v); }

using column = std::vector<double>;

// ---------- numeric block: R rows x C factor columns, stored by column ----------
struct numeric_block {
    std::size_t rows = 0;
    std::vector<column> columns;

    numeric_block() = default;
    numeric_block(std::size_t r, std::size_t c)
        : rows(r), columns(c, column(r, undefined)) {}

    std::size_t cols() const noexcept { return columns.size(); }
    double  at(std::size_t r, std::size_t c) const { return columns.at(c).at(r); }
    double& at(std::size_t r, std::size_t c)       { return columns.at(c).at(r); }

    std::size_t count_undefined() const noexcept {
        std::size_t n = 0;
        for (const auto& col : columns)
            for (double v : col)
                if (is_undefined(v)) ++n;
        return n;
    }
};

// ---------- raw input table as handed over by the reader ----------
// header[0] = entity id, header[1] = display name, header[2..] = factor names.
// Rows are kept as text; width checks belong to the orchestrator.
struct input_table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::size_t width() const noexcept { return header.size(); }
};

// ---------- output table: metadata + one numeric cell per factor ----------
struct result_table {
    std::vector<std::string> header;       // full header, metadata names first
    std::vector<std::string> entity_ids;
    std::vector<std::string> entity_names;
    numeric_block values;

    std::size_t rows() const noexcept { return entity_ids.size(); }
};

}
