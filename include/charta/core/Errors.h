#pragma once

#include "Types.h"

#include <stdexcept>
#include <string>

namespace charta {

/// An edge names a node id that the graph does not contain.
/// Raised by Graph::validate() before any layout work starts.
class DanglingReferenceError : public std::invalid_argument {
public:
    DanglingReferenceError(EdgeId edge, std::string from, std::string to, std::string missingId);

    EdgeId edge() const { return edge_; }
    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }
    const std::string& missingId() const { return missingId_; }

private:
    EdgeId edge_;
    std::string from_;
    std::string to_;
    std::string missingId_;
};

/// A glyph table has no character for a role the renderer needs
class GlyphUnmappedError : public std::logic_error {
public:
    GlyphUnmappedError(std::string role, std::string style);

    const std::string& role() const { return role_; }
    const std::string& style() const { return style_; }

private:
    std::string role_;
    std::string style_;
};

}  // namespace charta
