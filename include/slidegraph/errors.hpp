#pragma once

#include <stdexcept>
#include <string>

namespace slidegraph {

// Overlapping or out-of-bounds pieces, unsupported sizes, or a layout that
// cannot be read. Raised before any graph work starts.
class MalformedBoard : public std::invalid_argument {
public:
    explicit MalformedBoard(const std::string& what)
        : std::invalid_argument("malformed board: " + what) {}
};

// Lookup of a state ID that was never allocated.
class NotFound : public std::out_of_range {
public:
    explicit NotFound(const std::string& what)
        : std::out_of_range("not found: " + what) {}
};

} // namespace slidegraph
