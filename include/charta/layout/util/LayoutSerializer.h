#pragma once

#include "../config/LayoutEnums.h"
#include <string>

namespace charta {

// Forward declarations
class LayoutResult;

/// JSON serialization and file I/O for layout results, for hosts that
/// draw the geometry with their own renderer
class LayoutSerializer {
public:
    /// Current document version written under "version"
    static constexpr int FORMAT_VERSION = 1;

    /// Serialize layout result to JSON string
    static std::string toJson(const LayoutResult& result);

    /// Deserialize JSON string to layout result
    /// @throws std::runtime_error if parsing fails or a field is malformed
    static LayoutResult layoutResultFromJson(const std::string& json);

    /// Save layout result to file
    /// @return true if save succeeded
    static bool saveToFile(const LayoutResult& result, const std::string& path);

    /// Load layout result from file
    /// @throws std::runtime_error if the file cannot be read or parsed
    static LayoutResult loadFromFile(const std::string& path);

private:
    static std::string nodeEdgeToString(NodeEdge edge);
    static NodeEdge stringToNodeEdge(const std::string& str);
};

}  // namespace charta
