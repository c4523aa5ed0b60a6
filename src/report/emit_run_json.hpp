#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/pipeline.hpp"
#include "../metrics/timers.hpp"
#include "../util/json_escape.hpp"

namespace betarank {

struct RunInfo {
    std::string   started_iso;
    std::string   ended_iso;
    double        wall_ms = 0.0;
    std::string   input_path;
    std::uintmax_t input_bytes = 0;
    bool          latin1_fallback = false;
    std::vector<std::string> outputs;
};

// Writes run.json (schema v1): timing per stage plus the data-quality counts.
inline void emit_run_json(const std::string& out_path,
                          const RunInfo& run,
                          const std::vector<RunStage>& stages,
                          const transform_report& rep)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw io_error("Failed to open for write: " + out_path);

    f << "{\n";
    f << R"(  "version":"1",)"
      << "\n  " << fmt::format(R"("started_at":"{}",)", run.started_iso)
      << "\n  " << fmt::format(R"("ended_at":"{}",)", run.ended_iso)
      << "\n  " << fmt::format(R"("wall_time_ms":{},)", json_number(run.wall_ms))
      << "\n  " << fmt::format(R"("input":{{"path":"{}","bytes":{},"latin1_fallback":{}}},)",
                               json_escape(run.input_path), run.input_bytes,
                               run.latin1_fallback ? "true" : "false")
      << "\n  " << fmt::format(R"("rows":{},)", rep.rows)
      << "\n  " << fmt::format(R"("factor_columns":{},)", rep.factor_columns)
      << "\n  " << fmt::format(R"("pooled_population":{},)", rep.pooled_size)
      << "\n  " << fmt::format(R"("standardized_undefined":{},)", rep.standardized_undefined)
      << "\n  " << fmt::format(R"("transformed_undefined":{},)", rep.transformed_undefined);

    f << "\n  \"outputs\":[";
    for (size_t i = 0; i < run.outputs.size(); ++i) {
        if (i) f << ",";
        f << fmt::format(R"("{}")", json_escape(run.outputs[i]));
    }
    f << "],\n";

    f << "  \"stages\":[\n";
    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& s = stages[i];
        f << "    " << fmt::format(R"({{"name":"{}","calls":{},"wall_ms":{}}})",
                                   s.name, s.calls, json_number(s.wall_ms));
        if (i + 1 < stages.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"columns\":[\n";
    for (size_t i = 0; i < rep.columns.size(); ++i) {
        const auto& c = rep.columns[i];
        f << "    {"
          << fmt::format(R"("name":"{}","status":"{}","defined":{},"blank":{},"unparseable":{})",
                         json_escape(c.name), to_string(c.status),
                         c.defined_in, c.blank_cells, c.unparseable_cells)
          << fmt::format(R"(,"mean":{},"stddev":{},"undefined_transformed":{})",
                         json_number(c.mean), json_number(c.stddev), c.undefined_rows.size())
          << "}";
        if (i + 1 < rep.columns.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n";

    f << "}\n";
    if (!f) throw io_error("Failed to write: " + out_path);
}

}
