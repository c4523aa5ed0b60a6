// src/util/json_escape.hpp
#pragma once
#include <cmath>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace betarank {

// JSON string escaper for column names and paths.
// Escapes backslash, quote and control chars (< 0x20); UTF-8 passes through.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else          out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// JSON has no NaN/Inf literal.
inline std::string json_number(double v) {
    return std::isfinite(v) ? fmt::format("{}", v) : std::string("null");
}

}
