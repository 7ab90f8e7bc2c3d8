#pragma once

#include <stdexcept>

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a decode's abort check returns true.
class DecodeAborted : public std::runtime_error {
public:
    DecodeAborted() : std::runtime_error("decode aborted") {}
};
