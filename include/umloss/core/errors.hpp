#pragma once

#include <stdexcept>
#include <string>

namespace umloss {
namespace core {

// Raised when a component is handed input it cannot work with
// (empty point set, non-finite values, mismatched sizes, bad alpha, ...)
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what)
        : std::invalid_argument("invalid input: " + what) {}
};

} // namespace core
} // namespace umloss
