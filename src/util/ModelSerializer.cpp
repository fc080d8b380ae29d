#include "mxdiagram/util/ModelSerializer.h"
#include "mxdiagram/common/Logger.h"
#include "mxdiagram/core/GraphModel.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace mxdiagram {

namespace {

// Canvas string attributes, in wire order
struct CanvasField {
    const char* name;
    std::string GraphModel::*member;
};

constexpr CanvasField kCanvasFields[] = {
    {"grid", &GraphModel::grid},
    {"gridSize", &GraphModel::gridSize},
    {"guides", &GraphModel::guides},
    {"tooltips", &GraphModel::tooltips},
    {"connect", &GraphModel::connect},
    {"arrows", &GraphModel::arrows},
    {"fold", &GraphModel::fold},
    {"page", &GraphModel::page},
    {"pageScale", &GraphModel::pageScale},
    {"pageWidth", &GraphModel::pageWidth},
    {"pageHeight", &GraphModel::pageHeight},
    {"background", &GraphModel::background},
    {"math", &GraphModel::math},
    {"shadow", &GraphModel::shadow},
};

json geometryToJson(const Geometry& geometry) {
    json j = {
        {"x", geometry.x},
        {"y", geometry.y},
        {"width", geometry.width},
        {"height", geometry.height},
        {"relative", geometry.relative},
        {"as", geometry.as}
    };
    if (geometry.point) {
        j["point"] = {
            {"x", geometry.point->x},
            {"y", geometry.point->y},
            {"as", geometry.point->as}
        };
    }
    return j;
}

Geometry geometryFromJson(const json& j) {
    Geometry geometry;
    geometry.x = j.value("x", 0);
    geometry.y = j.value("y", 0);
    geometry.width = j.value("width", "");
    geometry.height = j.value("height", "");
    geometry.relative = j.value("relative", "");
    geometry.as = j.value("as", kGeometryAs);
    if (j.contains("point")) {
        const auto& p = j["point"];
        geometry.point = MxPoint(p.value("x", 0), p.value("y", 0), p.value("as", ""));
    }
    return geometry;
}

json cellToJson(const Cell& cell) {
    json style = json::object();
    for (const auto& [key, value] : cell.style) {
        style[key] = value;
    }

    json j = {
        {"id", cell.id},
        {"value", cell.value},
        {"style", style},
        {"parent", cell.parentId},
        {"vertex", cell.vertex},
        {"edge", cell.edge},
        {"source", cell.source},
        {"target", cell.target}
    };
    if (cell.geometry) {
        j["geometry"] = geometryToJson(*cell.geometry);
    }
    return j;
}

Cell cellFromJson(const json& j) {
    Cell cell;
    cell.id = j.value("id", "");
    cell.value = j.value("value", "");
    if (j.contains("style")) {
        for (auto& [key, value] : j["style"].items()) {
            cell.style.set(key, value.get<std::string>());
        }
    }
    cell.parentId = j.value("parent", "");
    cell.vertex = j.value("vertex", "");
    cell.edge = j.value("edge", "");
    cell.source = j.value("source", "");
    cell.target = j.value("target", "");
    if (j.contains("geometry")) {
        cell.geometry = geometryFromJson(j["geometry"]);
    }
    return cell;
}

}  // namespace

std::string ModelSerializer::toJson(const GraphModel& model) {
    json j;
    j["version"] = 1;
    j["dx"] = model.dx;
    j["dy"] = model.dy;

    json canvas = json::object();
    for (const auto& field : kCanvasFields) {
        const std::string& value = model.*field.member;
        if (!value.empty()) {
            canvas[field.name] = value;
        }
    }
    j["canvas"] = canvas;

    json cells = json::array();
    for (const auto& cell : model.cells()) {
        cells.push_back(cellToJson(cell));
    }
    j["cells"] = cells;

    return j.dump(2);
}

GraphModel ModelSerializer::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        GraphModel model;
        model.dx = j.value("dx", 0);
        model.dy = j.value("dy", 0);

        if (j.contains("canvas")) {
            const auto& canvas = j["canvas"];
            for (const auto& field : kCanvasFields) {
                model.*field.member = canvas.value(field.name, "");
            }
        }

        if (j.contains("cells")) {
            for (const auto& cellJson : j["cells"]) {
                model.add(cellFromJson(cellJson));
            }
        }

        return model;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse GraphModel JSON: ") + e.what());
    }
}

bool ModelSerializer::saveToFile(const GraphModel& model, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", path);
        return false;
    }
    file << toJson(model);
    file.flush();
    if (!file.good()) {
        LOG_ERROR("Failed while writing '{}'", path);
        return false;
    }
    return true;
}

bool ModelSerializer::loadFromFile(GraphModel& model, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for reading", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        model = fromJson(buffer.str());
        return true;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Failed to load '{}': {}", path, e.what());
        return false;
    }
}

}  // namespace mxdiagram
