#include "mxdiagram/core/Builders.h"

namespace mxdiagram {

namespace {

constexpr int kDefaultCanvasDx = 640;
constexpr int kDefaultCanvasDy = 480;
constexpr int kDefaultShapeOffset = 10;

Cell makeCell(const std::string& id, const std::string& parentId) {
    Cell cell;
    cell.id = id;
    cell.parentId = parentId;
    return cell;
}

Geometry makeDefaultGeometry() {
    Geometry geometry;
    geometry.x = kDefaultShapeOffset;
    geometry.y = kDefaultShapeOffset;
    geometry.as = kGeometryAs;
    return geometry;
}

}  // namespace

GraphModel newGraph() {
    Style rootStyle{{"html", "1"}};

    Cell canvasRoot;
    canvasRoot.id = kCanvasRootId;
    canvasRoot.style = rootStyle;

    Cell layer = makeCell(kDefaultLayerId, kCanvasRootId);
    layer.style = rootStyle;

    GraphModel model;
    model.dx = kDefaultCanvasDx;
    model.dy = kDefaultCanvasDy;
    model.add(canvasRoot).add(layer);
    return model;
}

Cell newShape(const std::string& id, const std::string& parentId) {
    Cell shape = makeCell(id, parentId);
    shape.vertex = kFlagSet;
    shape.geometry = makeDefaultGeometry();
    return shape;
}

Cell newImage(const std::string& id, const std::string& parentId, const std::string& url) {
    Cell image = newShape(id, parentId);
    image.style = Style{
        {"shape", "image"},
        {"imageAspect", "0"},
        {"image", url},
    };
    return image;
}

Cell newImageXY(const std::string& id, const std::string& parentId, const std::string& url,
                int x, int y) {
    Cell image = newImage(id, parentId, url);
    image.geometry->x = x;
    image.geometry->x = y;
    return image;
}

Cell newEdge(const std::string& id, const std::string& parentId,
             const std::string& sourceId, const std::string& targetId) {
    Cell edge = makeCell(id, parentId);
    edge.edge = kFlagSet;
    edge.source = sourceId;
    edge.target = targetId;

    Geometry geometry;
    geometry.relative = kFlagSet;
    geometry.as = kGeometryAs;
    edge.geometry = geometry;
    return edge;
}

}  // namespace mxdiagram
