#include <fmt/format.h>
#include <exception>

#include "../app/job.hpp"
#include "../cli/cli_options.hpp"
#include "../core/errors.hpp"

// Exit codes: 0 ok, 1 bad arguments, 2 I/O error, 3 malformed input, 4 internal error.
int main(int argc, char** argv) try {
    const auto opt = betarank::parse_cli(argc, argv);
    const auto result = betarank::run_job(opt);

    fmt::print("OK {}\n", result.transformed_path.string());
    if (!result.standardized_path.empty())
        fmt::print("OK {}\n", result.standardized_path.string());
    return 0;
}
catch (const CLI::ParseError& e) {
    return e.get_exit_code() == 0 ? 0 : 1; // already printed by CLI11
}
catch (const betarank::io_error& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 2;
}
catch (const betarank::shape_error& e) {
    fmt::print(stderr, "ERROR: malformed input: {}\n", e.what());
    return 3;
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 4;
}
