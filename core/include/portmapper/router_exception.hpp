#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace portmapper {

// The one error type raised by the router core. Low-level causes
// (std::system_error and friends) are attached with std::throw_with_nested.
class RouterException : public std::runtime_error {
public:
    explicit RouterException(const std::string& message)
        : std::runtime_error(message) {}
};

// Render an exception and every nested cause as "outer: inner: ...".
std::string describe_exception(const std::exception& e);

} // namespace portmapper
