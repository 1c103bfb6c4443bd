#pragma once

#include <ostream>
#include <string>

namespace charta {

class LayoutResult;

/// Abstract interface for layout exporters
///
/// A LayoutResult is self-contained, so exporters need nothing else.
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a layout to string
    virtual std::string exportToString(const LayoutResult& layout) = 0;

    /// Export to an output stream
    virtual void exportToStream(const LayoutResult& layout, std::ostream& out) = 0;

    /// Export to a file
    /// @return false when the file cannot be written
    virtual bool exportToFile(const LayoutResult& layout, const std::string& filename) = 0;

    /// Get the file extension for this export format (e.g., "txt")
    virtual std::string fileExtension() const = 0;

    /// Get the MIME type for this export format
    virtual std::string mimeType() const = 0;
};

}  // namespace charta
