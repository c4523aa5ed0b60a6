#pragma once
#include <stdexcept>
#include <string>

namespace betarank {

// Structural problem with the input table (too few columns, ragged rows).
// Raised before any computation; fatal for the run.
class shape_error : public std::invalid_argument {
public:
    explicit shape_error(const std::string& what) : std::invalid_argument(what) {}
};

// File could not be opened, read or written.
class io_error : public std::runtime_error {
public:
    explicit io_error(const std::string& what) : std::runtime_error(what) {}
};

}
