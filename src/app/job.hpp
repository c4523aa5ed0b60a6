// src/app/job.hpp
#pragma once
#include <fmt/format.h>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "../cli/cli_options.hpp"
#include "../core/errors.hpp"
#include "../core/pipeline.hpp"
#include "../csv/table_reader.hpp"
#include "../csv/table_writer.hpp"
#include "../io/output_naming.hpp"
#include "../metrics/timers.hpp"
#include "../report/emit_run_json.hpp"
#include "../report/render_summary.hpp"

namespace betarank {

struct JobResult {
    std::filesystem::path transformed_path;
    std::filesystem::path standardized_path;   // empty unless requested
    std::string summary;
    transform_report report;
};

inline std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

inline csv_dialect dialect_from(const AppOptions& opt) {
    csv_dialect d;
    d.delimiter  = opt.delimiter.empty() ? ',' : opt.delimiter[0];
    d.quote      = opt.quote.empty() ? '"' : opt.quote[0];
    d.has_header = opt.has_header;
    return d;
}

/**
 * One complete run: read the CSV, transform, write the outputs, summarize.
 * Options come in explicitly; nothing is read from ambient state.
 *
 * Throws io_error for file problems and shape_error for a table that cannot be
 * split into metadata and factor columns.
 */
inline JobResult run_job(const AppOptions& opt) {
    namespace fs = std::filesystem;

    const fs::path input_path = opt.input;
    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec))
        throw io_error("input not found: " + input_path.string());

    const auto started_iso = now_iso_utc();
    WallTimer wt_all; wt_all.start();
    std::vector<RunStage> stages;
    const csv_dialect dialect = dialect_from(opt);

    // --- stage: read
    StageTimer st_read("read_table");
    st_read.start();
    read_info info;
    input_table table = read_table(input_path, dialect, &info);
    if (opt.clean_numbers) clean_numeric_columns(table, metadata_columns);
    st_read.stop();
    stages.push_back(st_read.as_stage());

    if (info.latin1_fallback)
        fmt::print(stderr, "WARN: {} is not valid UTF-8; decoded as latin-1, verify characters are correct.\n",
                   input_path.string());

    // --- stage: transform
    StageTimer st_xf("transform");
    st_xf.start();
    run_result res = run(table);
    st_xf.stop();
    stages.push_back(st_xf.as_stage());

    if (res.report.rows == 0)
        fmt::print(stderr, "WARN: {} has a header but no data rows\n", input_path.string());

    // --- stage: write
    JobResult out;
    const std::string tag = opt.date_tag.empty()
        ? date_tag_from_filename(input_path.filename().string())
        : opt.date_tag;
    const output_paths names = make_output_paths(opt.output_dir, opt.prefix, tag);
    out.transformed_path = opt.output.empty() ? names.transformed : fs::path(opt.output);
    if (opt.write_standardized) out.standardized_path = names.standardized;

    StageTimer st_write("write_outputs");
    st_write.start();
    for (const fs::path& p : {out.transformed_path, out.standardized_path}) {
        if (p.empty() || !p.has_parent_path()) continue;
        fs::create_directories(p.parent_path(), ec);
        if (ec) throw io_error("failed to create " + p.parent_path().string() + " (" + ec.message() + ")");
    }
    write_table(out.transformed_path, res.transformed, dialect);
    if (!out.standardized_path.empty())
        write_table(out.standardized_path, res.standardized, dialect);
    st_write.stop();
    stages.push_back(st_write.as_stage());

    // --- summary
    out.summary = render_summary(res.report, input_path.string(),
                                 fs::path(opt.summary_template));
    if (!opt.quiet) fmt::print("{}", out.summary);

    wt_all.stop();
    if (!opt.run_json.empty()) {
        RunInfo run_info;
        run_info.started_iso = started_iso;
        run_info.ended_iso   = now_iso_utc();
        run_info.wall_ms     = wt_all.ms();
        run_info.input_path  = input_path.string();
        const auto sz = fs::file_size(input_path, ec);
        run_info.input_bytes = ec ? 0u : static_cast<std::uintmax_t>(sz);
        run_info.latin1_fallback = info.latin1_fallback;
        run_info.outputs.push_back(out.transformed_path.string());
        if (!out.standardized_path.empty()) run_info.outputs.push_back(out.standardized_path.string());
        emit_run_json(opt.run_json, run_info, stages, res.report);
    }

    out.report = std::move(res.report);
    return out;
}

}
