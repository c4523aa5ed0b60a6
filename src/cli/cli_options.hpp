#pragma once
#include <CLI/CLI.hpp>
#include <string>
#include <filesystem>

#ifndef BETARANK_VERSION
#define BETARANK_VERSION "0.1.0"
#endif

namespace betarank {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string output_dir = ".";
    std::string output;                          // explicit transformed path, overrides naming
    std::string prefix     = "transformed_factor_betas";
    std::string date_tag;                        // empty = derive from input name
    bool        write_standardized = false;

    // CSV parsing
    std::string delimiter = ",";        // single char, e.g. ","
    std::string quote     = "\"";       // single char, e.g. "\""
    bool        has_header = true;
    bool        clean_numbers = true;   // strip separators / unicode minus in factor cells

    // Reporting
    std::string summary_template;       // empty = built-in
    std::string run_json;               // empty = not written
    bool        quiet = false;
};

inline void configure_cli(CLI::App& app, AppOptions& opt) {
    app.set_version_flag("--version", BETARANK_VERSION);
    app.set_config("--config", "config/betarank.toml",
                   "TOML config file (keys = long option names)", /*required*/ false);

    // Required/basic
    app.add_option("--input",      opt.input,      "Path to input CSV (id, name, factor columns)")->required();
    app.add_option("--output-dir", opt.output_dir, "Directory for generated files");
    app.add_option("-o,--output",  opt.output,     "Explicit path for the transformed CSV");
    app.add_option("--prefix",     opt.prefix,     "Output file name prefix");
    app.add_option("--date-tag",   opt.date_tag,   "Date tag YYYY_MM_DD (default: from input file name)");
    app.add_flag("--write-standardized", opt.write_standardized,
                 "Also write the standardized (z-score) table");

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);
    app.add_option("--clean-numbers", opt.clean_numbers,
                   "Normalize thousands separators and unicode minus in factor cells (true/false)")
        ->default_val(true);

    // Reporting
    app.add_option("--summary-template", opt.summary_template, "Mustache template for the summary");
    app.add_option("--run-json",         opt.run_json,         "Write run metadata JSON to this path");
    app.add_flag("--quiet", opt.quiet, "Only print warnings, errors and the result path");
}

inline void validate_options(const AppOptions& opt) {
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    one_char(opt.delimiter, "delimiter");
    one_char(opt.quote,     "quote");
    if (opt.delimiter == opt.quote)
        throw CLI::ValidationError{"quote", "must differ from the delimiter"};
    if (opt.prefix.empty() && opt.output.empty())
        throw CLI::ValidationError{"prefix", "must not be empty"};
}

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"Factor beta standardize + exclusive percentile rescale"};
    configure_cli(app, opt);
    app.allow_windows_style_options();
    try {
        app.parse(argc, argv);
        validate_options(opt);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        throw;
    }
    return opt;
}

}
