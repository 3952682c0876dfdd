#pragma once
#include <stdexcept>
#include <string>

namespace Tickbar {

// non-positive maximum, unknown option name or malformed option value
class InvalidConfiguration : public std::invalid_argument {
    public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

// counter pushed past the maximum by the caller
class OutOfRange : public std::out_of_range {
    public:
    explicit OutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// output sink rejected a write
class WriteFailure : public std::runtime_error {
    public:
    explicit WriteFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Tickbar
