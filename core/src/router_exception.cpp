#include "portmapper/router_exception.hpp"

namespace portmapper {

namespace {

void append_nested(const std::exception& e, std::string& out) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        out += ": ";
        out += cause.what();
        append_nested(cause, out);
    }
}

} // namespace

std::string describe_exception(const std::exception& e) {
    std::string description = e.what();
    append_nested(e, description);
    return description;
}

} // namespace portmapper
