#pragma once
#include <stdexcept>
#include <string>

// Malformed command line or out-of-range options. The core is never invoked.
struct ConfigurationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// The footprint calibration produced a value that cannot size a block.
struct CalibrationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
