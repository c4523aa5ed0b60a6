// test_report.cpp: validation summary rendering and run.json emission.

#include <gtest/gtest.h>

#include "core/pipeline.hpp"
#include "report/emit_run_json.hpp"
#include "report/render_summary.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using betarank::input_table;
using betarank::render_summary;
using betarank::run;

namespace fs = std::filesystem;

namespace {

input_table messy_table() {
    input_table t;
    t.header = {"Symbol", "Company Name", "Value", "Flat", "Gappy"};
    t.rows = {
        {"AAA", "Alpha", "0.8", "2", "1.0"},
        {"BBB", "Bravo", "1.1", "2", "N/A"},
        {"CCC", "Charlie", "1.7", "2", "junk"},
        {"DDD", "Delta", "0.2", "2", "3.0"},
    };
    return t;
}

input_table clean_table() {
    input_table t;
    t.header = {"Symbol", "Company Name", "F1"};
    t.rows = {{"A", "a", "1"}, {"B", "b", "2"}, {"C", "c", "4"}};
    return t;
}

std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

}  // namespace

// ===========================================================================
// Summary
// ===========================================================================

TEST(Summary, ReportsShapeAndUndefinedCounts) {
    const auto res = run(messy_table());
    const std::string s = render_summary(res.report, "messy.csv");

    EXPECT_TRUE(contains(s, "Input: messy.csv")) << s;
    EXPECT_TRUE(contains(s, "Original betas shape: (4, 3)")) << s;
    EXPECT_TRUE(contains(s, "Standardized betas - blank cells: 6")) << s;
    EXPECT_TRUE(contains(s, "Transformed betas - blank cells: 6")) << s;
    EXPECT_TRUE(contains(s, "Input cells: 1 blank, 1 unparseable")) << s;
}

TEST(Summary, ListsDegenerateColumnsAndBlankLocations) {
    const auto res = run(messy_table());
    const std::string s = render_summary(res.report, "messy.csv");

    EXPECT_TRUE(contains(s, "Degenerate column 'Flat': zero standard deviation")) << s;
    EXPECT_TRUE(contains(s, "WARNING: Found blank cells in transformed data!")) << s;
    EXPECT_TRUE(contains(s, "Column 'Flat': rows 1, 2, 3, 4")) << s;
    EXPECT_TRUE(contains(s, "Column 'Gappy': rows 2, 3")) << s;
    EXPECT_FALSE(contains(s, "Column 'Value'")) << s;
    EXPECT_FALSE(contains(s, "All transformed beta cells are filled")) << s;
}

TEST(Summary, CleanRunSaysAllFilled) {
    const auto res = run(clean_table());
    const std::string s = render_summary(res.report, "clean.csv");
    EXPECT_TRUE(contains(s, "All transformed beta cells are filled")) << s;
    EXPECT_FALSE(contains(s, "WARNING")) << s;
    EXPECT_FALSE(contains(s, "Degenerate")) << s;
    EXPECT_FALSE(contains(s, "Input cells:")) << s;
}

TEST(Summary, CustomTemplateFile) {
    const fs::path tpl = fs::temp_directory_path() / "betarank_summary.mustache";
    {
        std::ofstream f(tpl, std::ios::binary);
        f << "{{{input}}}|{{{rows}}}x{{{factor_columns}}}|{{{transformed_undefined}}}";
    }
    const auto res = run(messy_table());
    EXPECT_EQ(render_summary(res.report, "m.csv", tpl), "m.csv|4x3|6");
    fs::remove(tpl);
}

TEST(Summary, MissingTemplateIsIoError) {
    const auto res = run(clean_table());
    EXPECT_THROW(render_summary(res.report, "x", fs::temp_directory_path() / "betarank_nope.mustache"),
                 betarank::io_error);
}

// ===========================================================================
// run.json
// ===========================================================================

TEST(RunJson, WritesCountsStagesAndColumns) {
    const auto res = run(messy_table());
    betarank::RunInfo info;
    info.started_iso = "2025-07-07T00:00:00Z";
    info.ended_iso   = "2025-07-07T00:00:01Z";
    info.wall_ms     = 12.5;
    info.input_path  = "C:\\data\\messy.csv";
    info.input_bytes = 128;
    info.outputs     = {"out/a.csv"};
    std::vector<betarank::RunStage> stages = {{"read_table", 1, 1.0}, {"transform", 1, 2.0}};

    const fs::path p = fs::temp_directory_path() / "betarank_run.json";
    betarank::emit_run_json(p.string(), info, stages, res.report);
    const std::string j = slurp(p);
    fs::remove(p);

    EXPECT_TRUE(contains(j, R"("version":"1")")) << j;
    EXPECT_TRUE(contains(j, R"("path":"C:\\data\\messy.csv")")) << j;
    EXPECT_TRUE(contains(j, R"("rows":4,)")) << j;
    EXPECT_TRUE(contains(j, R"("factor_columns":3,)")) << j;
    EXPECT_TRUE(contains(j, R"("transformed_undefined":6,)")) << j;
    EXPECT_TRUE(contains(j, R"({"name":"transform","calls":1,"wall_ms":2})")) << j;
    EXPECT_TRUE(contains(j, R"("name":"Flat","status":"zero standard deviation")")) << j;
    // undefined stddev is not valid JSON as NaN
    EXPECT_FALSE(contains(j, "nan")) << j;
}
