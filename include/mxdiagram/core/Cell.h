#pragma once

#include "Style.h"
#include "Types.h"

#include <optional>
#include <string>

namespace mxdiagram {

/// A single diagram element (<mxCell>): either a vertex (shape) or an edge
///
/// All string attributes are optional on the wire; an empty string means
/// the attribute is absent. `vertex` and `edge` hold "1" when set and are
/// mutually exclusive by convention only.
///
/// Ids, parent references and edge endpoints are plain strings. Nothing
/// here checks that they are unique or resolve to another cell; see
/// ModelValidator for an opt-in check.
struct Cell {
    std::string id;
    std::string value;      ///< Display label
    Style style;
    std::string parentId;
    std::string vertex;
    std::string edge;
    std::string source;     ///< Source cell id, edges only
    std::string target;     ///< Target cell id, edges only
    std::optional<Geometry> geometry;

    bool isVertex() const { return vertex == kFlagSet; }
    bool isEdge() const { return edge == kFlagSet; }

    bool operator==(const Cell& o) const {
        return id == o.id && value == o.value && style == o.style &&
               parentId == o.parentId && vertex == o.vertex && edge == o.edge &&
               source == o.source && target == o.target && geometry == o.geometry;
    }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

}  // namespace mxdiagram
