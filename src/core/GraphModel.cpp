#include "mxdiagram/core/GraphModel.h"

#include <algorithm>

namespace mxdiagram {

GraphModel& GraphModel::add(const Cell& cell) {
    cells_.push_back(cell);
    return *this;
}

const Cell* GraphModel::findCell(const std::string& id) const {
    auto it = std::find_if(cells_.begin(), cells_.end(),
                           [&id](const Cell& c) { return c.id == id; });
    return it != cells_.end() ? &*it : nullptr;
}

bool GraphModel::operator==(const GraphModel& o) const {
    return dx == o.dx && dy == o.dy &&
           grid == o.grid && gridSize == o.gridSize && guides == o.guides &&
           tooltips == o.tooltips && connect == o.connect && arrows == o.arrows &&
           fold == o.fold && page == o.page && pageScale == o.pageScale &&
           pageWidth == o.pageWidth && pageHeight == o.pageHeight &&
           background == o.background && math == o.math && shadow == o.shadow &&
           cells_ == o.cells_;
}

}  // namespace mxdiagram
