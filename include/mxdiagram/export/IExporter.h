#pragma once

#include <ostream>
#include <string>

namespace mxdiagram {

class GraphModel;

/// Abstract interface for diagram exporters
///
/// Each output format implements this interface so callers can switch
/// formats without touching the code that builds the model.
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual std::string exportToString(const GraphModel& model) = 0;

    virtual void exportToStream(const GraphModel& model, std::ostream& out) = 0;

    /// @return false if the file could not be opened for writing
    virtual bool exportToFile(const GraphModel& model, const std::string& filename) = 0;

    /// File extension for this format, without the dot
    virtual std::string fileExtension() const = 0;

    virtual std::string mimeType() const = 0;
};

}  // namespace mxdiagram
