// src/csv/table_writer.hpp
#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/table.hpp"
#include "table_reader.hpp"

namespace betarank {

inline std::string quote_field(std::string_view s, char delim, char quote) {
    const bool needs = s.find(delim) != std::string_view::npos
                    || s.find(quote) != std::string_view::npos
                    || s.find('\n')  != std::string_view::npos
                    || s.find('\r')  != std::string_view::npos;
    if (!needs) return std::string(s);
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back(quote);
    for (char c : s) {
        if (c == quote) out.push_back(quote);
        out.push_back(c);
    }
    out.push_back(quote);
    return out;
}

// Shortest decimal that round-trips; undefined is an empty field.
inline std::string format_cell(double v) {
    if (is_undefined(v)) return {};
    return fmt::format("{}", v);
}

inline void write_table(std::ostream& os, const result_table& t, const csv_dialect& dialect) {
    const char d = dialect.delimiter;
    const char q = dialect.quote;

    for (std::size_t i = 0; i < t.header.size(); ++i) {
        if (i) os << d;
        os << quote_field(t.header[i], d, q);
    }
    os << '\n';

    for (std::size_t r = 0; r < t.rows(); ++r) {
        os << quote_field(t.entity_ids[r], d, q) << d << quote_field(t.entity_names[r], d, q);
        for (std::size_t c = 0; c < t.values.cols(); ++c) {
            os << d << format_cell(t.values.columns[c][r]);
        }
        os << '\n';
    }
}

inline void write_table(const std::filesystem::path& path, const result_table& t,
                        const csv_dialect& dialect) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw io_error("Failed to open for write: " + path.string());
    write_table(f, t, dialect);
    f.flush();
    if (!f) throw io_error("Failed to write: " + path.string());
}

}
