#pragma once
#include <string_view>
#include <string>
#include <vector>

namespace betarank {

// Tokens treated as an intentionally empty cell rather than bad text.
inline const std::vector<std::string>& default_null_tokens() {
    static const std::vector<std::string> tokens = {
        "", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
        "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None",
        "n/a", "nan", "null"
    };
    return tokens;
}

inline bool is_null_like(std::string_view s,
                         const std::vector<std::string>& nulls = default_null_tokens()) {
    for (const auto& n : nulls) {
        if (s == n) return true;
    }
    return false;
}

}
