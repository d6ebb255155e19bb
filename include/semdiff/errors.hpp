#pragma once

/// @file include/semdiff/errors.hpp
/// @brief Exception raised for caller-controlled configuration violations.
///
/// Empty data is never an error in semdiff: the analysis functions return
/// defined degenerate results instead. Only parameters the caller fixes up
/// front (scale points, cluster count, iteration budget) are validated, and a
/// violation throws InvalidConfiguration.

#include <stdexcept>
#include <string>

namespace semdiff {

class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument(what) {}
};

}  // namespace semdiff
