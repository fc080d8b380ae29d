#pragma once

#include "Cell.h"
#include "GraphModel.h"

#include <string>

namespace mxdiagram {

/// New document with dx=640, dy=480 and the two structural cells:
/// the canvas root (id "0") and the default layer (id "1", parent "0"),
/// both styled `html=1`.
GraphModel newGraph();

/// Vertex cell with a default geometry (x=10, y=10, as="geometry") and an
/// empty style, which you will usually want to change.
Cell newShape(const std::string& id, const std::string& parentId);

/// Image vertex. Starts from newShape() and then replaces the style
/// wholesale with {shape=image, imageAspect=0, image=url}.
Cell newImage(const std::string& id, const std::string& parentId, const std::string& url);

/// Image vertex placed at a position.
///
/// Compatibility note: existing generated files rely on the historical
/// behaviour, where the geometry's x receives `y` and its y keeps the
/// default of 10. The `x` argument has no effect.
Cell newImageXY(const std::string& id, const std::string& parentId, const std::string& url,
                int x, int y);

/// Edge cell connecting source to target, with a relative geometry
/// (relative="1", as="geometry") and an empty style.
Cell newEdge(const std::string& id, const std::string& parentId,
             const std::string& sourceId, const std::string& targetId);

}  // namespace mxdiagram
