#pragma once
#include <mustache.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "../core/errors.hpp"
#include "../core/pipeline.hpp"

namespace betarank {

// Triple braces everywhere: the summary is plain text, not HTML.
inline const char* default_summary_template() {
    return
R"(Data validation:
Input: {{{input}}}
Original betas shape: ({{{rows}}}, {{{factor_columns}}})
Pooled population: {{{pooled}}} values
Standardized betas - blank cells: {{{standardized_undefined}}}
Transformed betas - blank cells: {{{transformed_undefined}}}
{{#has_input_issues}}
Input cells: {{{blank_cells}}} blank, {{{unparseable_cells}}} unparseable
{{/has_input_issues}}
{{#degenerate}}
  Degenerate column '{{{name}}}': {{{reason}}}
{{/degenerate}}
{{#has_blanks}}
WARNING: Found blank cells in transformed data!
{{#blank_columns}}
  Column '{{{name}}}': rows {{{rows}}}
{{/blank_columns}}
{{/has_blanks}}
{{^has_blanks}}
All transformed beta cells are filled
{{/has_blanks}}
)";
}

inline std::string load_template(const std::filesystem::path& p) {
    std::ifstream tf(p, std::ios::binary);
    if (!tf) throw io_error("Failed to read template: " + p.string());
    std::ostringstream tss; tss << tf.rdbuf();
    return tss.str();
}

inline kainjow::mustache::data summary_context(const transform_report& rep,
                                               const std::string& input_label) {
    using kainjow::mustache::data;
    auto str = [](auto v) { return data(fmt::format("{}", v)); };

    data ctx;
    ctx.set("input",                  data(input_label));
    ctx.set("rows",                   str(rep.rows));
    ctx.set("factor_columns",         str(rep.factor_columns));
    ctx.set("pooled",                 str(rep.pooled_size));
    ctx.set("standardized_undefined", str(rep.standardized_undefined));
    ctx.set("transformed_undefined",  str(rep.transformed_undefined));

    std::size_t blanks = 0, unparseable = 0;
    data degenerate{data::type::list};
    data blank_columns{data::type::list};
    for (const auto& c : rep.columns) {
        blanks      += c.blank_cells;
        unparseable += c.unparseable_cells;
        if (c.status != column_status::ok) {
            data item;
            item.set("name",   data(c.name));
            item.set("reason", data(std::string(to_string(c.status))));
            degenerate.push_back(item);
        }
        if (!c.undefined_rows.empty()) {
            std::string rows;
            for (std::size_t i = 0; i < c.undefined_rows.size(); ++i) {
                if (i) rows += ", ";
                rows += std::to_string(c.undefined_rows[i] + 1);
            }
            data item;
            item.set("name", data(c.name));
            item.set("rows", data(rows));
            blank_columns.push_back(item);
        }
    }
    ctx.set("blank_cells",       str(blanks));
    ctx.set("unparseable_cells", str(unparseable));
    ctx.set("has_input_issues",  data(blanks + unparseable > 0));
    ctx.set("degenerate",        degenerate);
    ctx.set("blank_columns",     blank_columns);
    ctx.set("has_blanks",        data(rep.transformed_undefined > 0));
    return ctx;
}

/**
 * Renders the post-run validation summary. Row numbers are 1-based data rows.
 *
 * @param template_path  empty for the built-in template
 */
inline std::string render_summary(const transform_report& rep,
                                  const std::string& input_label,
                                  const std::filesystem::path& template_path = {}) {
    const std::string tmpl = template_path.empty()
        ? std::string(default_summary_template())
        : load_template(template_path);

    kainjow::mustache::mustache m{tmpl};
    if (!m.is_valid()) throw std::runtime_error("Summary template parse error: " + m.error_message());
    return m.render(summary_context(rep, input_label));
}

}
