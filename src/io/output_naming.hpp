// src/io/output_naming.hpp
#pragma once
#include <ctime>
#include <filesystem>
#include <regex>
#include <string>

#include <fmt/format.h>

namespace betarank {

inline bool is_real_date(int y, int m, int d) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12 || d < 1) return false;
    const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
    const int limit = (m == 2 && leap) ? 29 : days[m - 1];
    return d <= limit;
}

inline std::string format_date_tag(int y, int m, int d) {
    return fmt::format("{:04d}_{:02d}_{:02d}", y, m, d);
}

inline std::tm local_today() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

/**
 * Date tag (YYYY_MM_DD) for output names, taken from the input file's stem.
 * Patterns are tried in order, first match only:
 *   20YYMMDD, 20YY-MM-DD (or _), MM-DD-20YY (or _).
 * Falls back to `today` when nothing yields a real calendar date.
 */
inline std::string date_tag_from_filename(const std::string& filename, const std::tm& today) {
    const std::string stem = std::filesystem::path(filename).stem().string();
    std::smatch m;

    static const std::regex compact(R"((20\d{2})([01]\d)([0-3]\d))");
    if (std::regex_search(stem, m, compact)) {
        const int y = std::stoi(m[1].str()), mo = std::stoi(m[2].str()), d = std::stoi(m[3].str());
        if (is_real_date(y, mo, d)) return format_date_tag(y, mo, d);
    }
    static const std::regex ymd(R"((20\d{2})[-_](\d{2})[-_](\d{2}))");
    if (std::regex_search(stem, m, ymd)) {
        const int y = std::stoi(m[1].str()), mo = std::stoi(m[2].str()), d = std::stoi(m[3].str());
        if (is_real_date(y, mo, d)) return format_date_tag(y, mo, d);
    }
    static const std::regex mdy(R"((\d{2})[-_](\d{2})[-_](20\d{2}))");
    if (std::regex_search(stem, m, mdy)) {
        const int mo = std::stoi(m[1].str()), d = std::stoi(m[2].str()), y = std::stoi(m[3].str());
        if (is_real_date(y, mo, d)) return format_date_tag(y, mo, d);
    }
    return format_date_tag(today.tm_year + 1900, today.tm_mon + 1, today.tm_mday);
}

inline std::string date_tag_from_filename(const std::string& filename) {
    return date_tag_from_filename(filename, local_today());
}

struct output_paths {
    std::filesystem::path transformed;
    std::filesystem::path standardized;
};

inline output_paths make_output_paths(const std::filesystem::path& dir,
                                      const std::string& prefix,
                                      const std::string& date_tag) {
    const std::string base = fmt::format("{}_{}", prefix, date_tag);
    return output_paths{
        dir / (base + "_TransformedBetas.csv"),
        dir / (base + "_StandardizedBetas.csv")
    };
}

}
