#include "mxdiagram/import/MxGraphXmlReader.h"
#include "mxdiagram/common/Logger.h"

#include <pugixml.hpp>

#include <cstring>
#include <fstream>

namespace mxdiagram {

namespace {

MxPoint readPoint(pugi::xml_node node) {
    MxPoint point;
    point.x = node.attribute("x").as_int();
    point.y = node.attribute("y").as_int();
    point.as = node.attribute("as").as_string();
    return point;
}

Geometry readGeometry(pugi::xml_node node) {
    Geometry geometry;
    geometry.x = node.attribute("x").as_int();
    geometry.y = node.attribute("y").as_int();
    geometry.width = node.attribute("width").as_string();
    geometry.height = node.attribute("height").as_string();
    geometry.relative = node.attribute("relative").as_string();
    geometry.as = node.attribute("as").as_string();

    if (pugi::xml_node point = node.child("mxPoint")) {
        geometry.point = readPoint(point);
    }
    return geometry;
}

Cell readCell(pugi::xml_node node) {
    Cell cell;
    cell.id = node.attribute("id").as_string();
    cell.value = node.attribute("value").as_string();
    if (pugi::xml_attribute style = node.attribute("style")) {
        cell.style = Style::decode(style.as_string());
    }
    cell.parentId = node.attribute("parent").as_string();
    cell.vertex = node.attribute("vertex").as_string();
    cell.edge = node.attribute("edge").as_string();
    cell.source = node.attribute("source").as_string();
    cell.target = node.attribute("target").as_string();

    if (pugi::xml_node geometry = node.child("mxGeometry")) {
        cell.geometry = readGeometry(geometry);
    }
    return cell;
}

GraphModel readDocument(const pugi::xml_document& doc, const pugi::xml_parse_result& result) {
    if (!result) {
        throw MxGraphParseError(std::string("Malformed mxGraphModel XML at offset ") +
                                std::to_string(result.offset) + ": " + result.description());
    }

    pugi::xml_node graph = doc.document_element();
    if (std::strcmp(graph.name(), "mxGraphModel") != 0) {
        throw MxGraphParseError(std::string("Expected <mxGraphModel> document element, found <") +
                                graph.name() + ">");
    }

    GraphModel model;
    model.dx = graph.attribute("dx").as_int();
    model.dy = graph.attribute("dy").as_int();
    model.grid = graph.attribute("grid").as_string();
    model.gridSize = graph.attribute("gridSize").as_string();
    model.guides = graph.attribute("guides").as_string();
    model.tooltips = graph.attribute("tooltips").as_string();
    model.connect = graph.attribute("connect").as_string();
    model.arrows = graph.attribute("arrows").as_string();
    model.fold = graph.attribute("fold").as_string();
    model.page = graph.attribute("page").as_string();
    model.pageScale = graph.attribute("pageScale").as_string();
    model.pageWidth = graph.attribute("pageWidth").as_string();
    model.pageHeight = graph.attribute("pageHeight").as_string();
    model.background = graph.attribute("background").as_string();
    model.math = graph.attribute("math").as_string();
    model.shadow = graph.attribute("shadow").as_string();

    for (pugi::xml_node child : graph.child("root").children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (std::strcmp(child.name(), "mxCell") != 0) {
            LOG_WARN("Skipping unsupported <{}> element under <root>", child.name());
            continue;
        }
        model.add(readCell(child));
    }

    LOG_DEBUG("Decoded mxGraphModel with {} cells", model.cellCount());
    return model;
}

}  // namespace

GraphModel MxGraphXmlReader::fromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    return readDocument(doc, result);
}

GraphModel MxGraphXmlReader::fromStream(std::istream& in) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load(in);
    return readDocument(doc, result);
}

std::optional<GraphModel> MxGraphXmlReader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for reading", path);
        return std::nullopt;
    }

    try {
        return fromStream(file);
    } catch (const MxGraphParseError& e) {
        LOG_ERROR("Failed to load '{}': {}", path, e.what());
        return std::nullopt;
    }
}

}  // namespace mxdiagram
