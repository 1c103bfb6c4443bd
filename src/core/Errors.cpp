#include "charta/core/Errors.h"

namespace charta {

DanglingReferenceError::DanglingReferenceError(EdgeId edge, std::string from, std::string to,
                                               std::string missingId)
    : std::invalid_argument("Edge " + std::to_string(edge) + " (" + from + " -> " + to +
                            ") references unknown node '" + missingId + "'"),
      edge_(edge),
      from_(std::move(from)),
      to_(std::move(to)),
      missingId_(std::move(missingId)) {}

GlyphUnmappedError::GlyphUnmappedError(std::string role, std::string style)
    : std::logic_error("No glyph for role '" + role + "' in style '" + style + "'"),
      role_(std::move(role)),
      style_(std::move(style)) {}

}  // namespace charta
