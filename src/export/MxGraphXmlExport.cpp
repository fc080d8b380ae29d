#include "mxdiagram/export/MxGraphXmlExport.h"
#include "mxdiagram/common/Logger.h"

#include <pugixml.hpp>

#include <fstream>
#include <sstream>

namespace mxdiagram {

namespace {

void setIfNotEmpty(pugi::xml_node node, const char* name, const std::string& value) {
    if (!value.empty()) {
        node.append_attribute(name).set_value(value.c_str());
    }
}

void setIfNonZero(pugi::xml_node node, const char* name, int value) {
    if (value != 0) {
        node.append_attribute(name).set_value(value);
    }
}

void writePoint(pugi::xml_node parent, const MxPoint& point) {
    pugi::xml_node node = parent.append_child("mxPoint");
    setIfNonZero(node, "x", point.x);
    setIfNonZero(node, "y", point.y);
    node.append_attribute("as").set_value(point.as.c_str());
}

void writeGeometry(pugi::xml_node parent, const Geometry& geometry) {
    pugi::xml_node node = parent.append_child("mxGeometry");
    setIfNonZero(node, "x", geometry.x);
    setIfNonZero(node, "y", geometry.y);
    setIfNotEmpty(node, "width", geometry.width);
    setIfNotEmpty(node, "height", geometry.height);
    setIfNotEmpty(node, "relative", geometry.relative);
    node.append_attribute("as").set_value(geometry.as.c_str());

    if (geometry.point) {
        writePoint(node, *geometry.point);
    }
}

void writeCell(pugi::xml_node root, const Cell& cell) {
    pugi::xml_node node = root.append_child("mxCell");
    node.append_attribute("id").set_value(cell.id.c_str());
    setIfNotEmpty(node, "value", cell.value);
    if (!cell.style.empty()) {
        node.append_attribute("style").set_value(cell.style.encode().c_str());
    }
    setIfNotEmpty(node, "parent", cell.parentId);
    setIfNotEmpty(node, "vertex", cell.vertex);
    setIfNotEmpty(node, "edge", cell.edge);
    setIfNotEmpty(node, "source", cell.source);
    setIfNotEmpty(node, "target", cell.target);

    if (cell.geometry) {
        writeGeometry(node, *cell.geometry);
    }
}

void buildDocument(const GraphModel& model, pugi::xml_document& doc) {
    pugi::xml_node graph = doc.append_child("mxGraphModel");
    graph.append_attribute("dx").set_value(model.dx);
    graph.append_attribute("dy").set_value(model.dy);

    setIfNotEmpty(graph, "grid", model.grid);
    setIfNotEmpty(graph, "gridSize", model.gridSize);
    setIfNotEmpty(graph, "guides", model.guides);
    setIfNotEmpty(graph, "tooltips", model.tooltips);
    setIfNotEmpty(graph, "connect", model.connect);
    setIfNotEmpty(graph, "arrows", model.arrows);
    setIfNotEmpty(graph, "fold", model.fold);
    setIfNotEmpty(graph, "page", model.page);
    setIfNotEmpty(graph, "pageScale", model.pageScale);
    setIfNotEmpty(graph, "pageWidth", model.pageWidth);
    setIfNotEmpty(graph, "pageHeight", model.pageHeight);
    setIfNotEmpty(graph, "background", model.background);
    setIfNotEmpty(graph, "math", model.math);
    setIfNotEmpty(graph, "shadow", model.shadow);

    pugi::xml_node root = graph.append_child("root");
    for (const auto& cell : model.cells()) {
        writeCell(root, cell);
    }
}

}  // namespace

MxGraphXmlExport::MxGraphXmlExport(const MxGraphXmlOptions& options)
    : options_(options) {}

std::string MxGraphXmlExport::exportToString(const GraphModel& model) {
    std::ostringstream out;
    exportToStream(model, out);
    return out.str();
}

void MxGraphXmlExport::exportToStream(const GraphModel& model, std::ostream& out) {
    pugi::xml_document doc;
    buildDocument(model, doc);

    unsigned int flags = options_.rawOutput ? pugi::format_raw : pugi::format_indent;
    if (!options_.xmlDeclaration) {
        flags |= pugi::format_no_declaration;
    }

    doc.save(out, options_.indent.c_str(), flags, pugi::encoding_utf8);
    LOG_DEBUG("Exported mxGraphModel with {} cells", model.cellCount());
}

bool MxGraphXmlExport::exportToFile(const GraphModel& model, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", filename);
        return false;
    }
    exportToStream(model, file);
    file.flush();
    if (!file.good()) {
        LOG_ERROR("Failed while writing '{}'", filename);
        return false;
    }
    return true;
}

}  // namespace mxdiagram
