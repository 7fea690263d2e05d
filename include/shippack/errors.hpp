#pragma once

#include <stdexcept>
#include <string>

namespace shippack {

// Malformed caller input (missing/non-numeric field, non-positive dimension, ...).
// The message names the offending field, e.g. "products[1].dimensions.width".
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// No box, not even the synthesized custom box, can take a remaining unit.
class PackingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace shippack
