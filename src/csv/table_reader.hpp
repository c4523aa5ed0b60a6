// src/csv/table_reader.hpp
#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/table.hpp"
#include "../types/numeric_text.hpp"
#include "../util/encoding.hpp"

namespace betarank {

struct csv_dialect {
    char delimiter  = ',';
    char quote      = '"';
    bool has_header = true;
};

struct read_info {
    std::size_t records = 0;        // logical records, header included
    bool latin1_fallback = false;   // bytes were not UTF-8, decoded as Latin-1
};

// RFC4180-ish tokenizer over an in-memory document.
// - delimiters and newlines only count outside quotes
// - "" inside quotes is a literal quote
// - CR, LF and CRLF all end a record
// - records with no characters at all (blank lines) are dropped
inline std::vector<std::vector<std::string>> tokenize_records(std::string_view text,
                                                              char delim,
                                                              char quote) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    std::string cur;
    bool inq = false;
    bool touched = false;     // saw anything in this record
    bool field_started = false;  // a quote only opens quoting at field start
    std::size_t quote_open_record = 0;

    auto end_record = [&]() {
        if (touched) {
            fields.push_back(std::move(cur));
            records.push_back(std::move(fields));
        }
        fields.clear();
        cur.clear();
        touched = false;
        field_started = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inq) {
            if (c == quote) {
                if (i + 1 < text.size() && text[i + 1] == quote) { cur.push_back(quote); ++i; }
                else inq = false;
            } else {
                cur.push_back(c);
            }
            continue;
        }
        if (c == quote && !field_started) {
            inq = true;
            touched = true;
            field_started = true;
            quote_open_record = records.size() + 1;
        } else if (c == delim) {
            fields.push_back(std::move(cur));
            cur.clear();
            touched = true;
            field_started = false;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_record();
        } else {
            cur.push_back(c);       // includes a quote inside an unquoted field
            touched = true;
            field_started = true;
        }
    }
    if (inq) {
        throw shape_error(fmt::format(
            "unterminated quoted field in record {}", quote_open_record));
    }
    end_record();
    return records;
}

inline std::string read_file_bytes(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw io_error("Failed to open: " + path.string());
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) throw io_error("Failed to read: " + path.string());
    return oss.str();
}

inline input_table parse_table(std::string text, const csv_dialect& dialect,
                               read_info* info = nullptr) {
    read_info ri;
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);
    if (!is_valid_utf8(text)) {
        text = latin1_to_utf8(text);
        ri.latin1_fallback = true;
    }

    auto records = tokenize_records(text, dialect.delimiter, dialect.quote);
    ri.records = records.size();
    if (info) *info = ri;
    if (records.empty()) throw shape_error("input has no records");

    input_table t;
    std::size_t first_data = 0;
    if (dialect.has_header) {
        t.header = std::move(records.front());
        first_data = 1;
    } else {
        t.header.resize(records.front().size());
        for (std::size_t i = 0; i < t.header.size(); ++i)
            t.header[i] = "col" + std::to_string(i + 1);
    }
    t.rows.reserve(records.size() - first_data);
    for (std::size_t r = first_data; r < records.size(); ++r)
        t.rows.push_back(std::move(records[r]));
    return t;
}

inline input_table read_table(const std::filesystem::path& path,
                              const csv_dialect& dialect,
                              read_info* info = nullptr) {
    return parse_table(read_file_bytes(path), dialect, info);
}

// Normalize numeric text in every factor column (everything after the
// metadata columns). Metadata is left as-is.
inline void clean_numeric_columns(input_table& t, std::size_t first_factor = 2) {
    for (auto& row : t.rows)
        for (std::size_t c = first_factor; c < row.size(); ++c)
            row[c] = normalize_numeric_text(row[c]);
}

}
