// src/types/numeric_text.hpp
#pragma once
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "../util/nulls.hpp"

namespace betarank {

enum class cell_kind { number, blank, unparseable };

inline std::string_view trim_ascii(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Spreadsheet exports leave thousands separators (',' and U+00A0) and U+2212
// minus signs in numeric columns. Strip them down to a plain literal.
inline std::string normalize_numeric_text(std::string_view in) {
    static constexpr std::string_view nbsp  = "\xC2\xA0";
    static constexpr std::string_view minus = "\xE2\x88\x92";

    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size();) {
        if (in.compare(i, nbsp.size(), nbsp) == 0)   { i += nbsp.size(); continue; }
        if (in.compare(i, minus.size(), minus) == 0) { out.push_back('-'); i += minus.size(); continue; }
        if (in[i] == ',') { ++i; continue; }
        out.push_back(in[i]);
        ++i;
    }
    return std::string(trim_ascii(out));
}

// sign? (digits [. digits?] | . digits) ([eE] sign? digits)?
inline bool is_real_literal(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    bool mantissa_digit = false, dot = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { mantissa_digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        break;
    }
    if (!mantissa_digit) return false;
    if (i == s.size()) return true;
    if (s[i] != 'e' && s[i] != 'E') return false;
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

// Whole-string parse. Null tokens, stray text and non-finite results are missing.
inline std::optional<double> parse_real(std::string_view text) {
    const std::string_view t = trim_ascii(text);
    if (!is_real_literal(t)) return std::nullopt;
    const std::string buf(t);
    char* end = nullptr;
    const double v = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline cell_kind classify_cell(std::string_view text) {
    const std::string_view t = trim_ascii(text);
    if (is_null_like(t)) return cell_kind::blank;
    return parse_real(t) ? cell_kind::number : cell_kind::unparseable;
}

}
