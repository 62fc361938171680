#pragma once

#include <stdexcept>
#include <string>

namespace sigrun {

// Base class of all errors thrown by sigrun
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

// Statics and dynamics of a tree or comprehension row do not line up.
// Indicates a bug in the code generating the tree.
class ArityMismatch : public Error {
public:
    using Error::Error;
};

// Two trees that are required to share statics do not. Indicates diffing
// across different template sites.
class StructuralMismatch : public Error {
public:
    using Error::Error;
};

// A wire value has an invalid shape
class DecodeError : public Error {
public:
    using Error::Error;
};
}
