#pragma once

#include "../core/GraphModel.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace mxdiagram {

/// Options for mxGraph XML export
struct MxGraphXmlOptions {
    /// Indentation unit for nested elements
    std::string indent = "  ";

    /// Emit `<?xml version="1.0"?>` before the model
    bool xmlDeclaration = false;

    /// Write everything on a single line (indent is ignored)
    bool rawOutput = false;
};

/// Writes a GraphModel as an uncompressed <mxGraphModel> document that the
/// diagram editor opens directly.
///
/// Attribute rules:
/// - dx/dy are always written
/// - geometry and point x/y are omitted when 0
/// - every other optional attribute is omitted when empty; an empty Style
///   omits `style`
/// - `as` on geometries and points is always written
class MxGraphXmlExport : public IExporter {
public:
    MxGraphXmlExport() = default;
    explicit MxGraphXmlExport(const MxGraphXmlOptions& options);
    ~MxGraphXmlExport() override = default;

    std::string exportToString(const GraphModel& model) override;
    void exportToStream(const GraphModel& model, std::ostream& out) override;
    bool exportToFile(const GraphModel& model, const std::string& filename) override;

    std::string fileExtension() const override { return "drawio"; }
    std::string mimeType() const override { return "application/xml"; }

    void setOptions(const MxGraphXmlOptions& options) { options_ = options; }
    const MxGraphXmlOptions& options() const { return options_; }

private:
    MxGraphXmlOptions options_;
};

}  // namespace mxdiagram
