#pragma once

#include "Cell.h"

#include <string>
#include <vector>

namespace mxdiagram {

/// Document root (<mxGraphModel>)
///
/// Holds the canvas settings and the ordered cell sequence written under
/// <root>. For the editor to accept the document the first two cells must
/// be the canvas root (id "0") and the default layer (id "1", parent "0");
/// use newGraph() to get a model seeded with both.
///
/// Cells are stored by value and the sequence only grows. A model is meant
/// to be used from one thread at a time.
class GraphModel {
public:
    GraphModel() = default;

    // Canvas offset, always written
    int dx = 0;
    int dy = 0;

    // Canvas settings, free-form and omitted from output when empty
    std::string grid;
    std::string gridSize;
    std::string guides;
    std::string tooltips;
    std::string connect;
    std::string arrows;
    std::string fold;
    std::string page;
    std::string pageScale;
    std::string pageWidth;
    std::string pageHeight;
    std::string background;
    std::string math;
    std::string shadow;

    /// Append a copy of cell. Later changes to the caller's cell are not
    /// reflected in the model. No id or parent checks are made.
    /// @return *this, for chaining
    GraphModel& add(const Cell& cell);

    /// First cell with the given id, or nullptr
    const Cell* findCell(const std::string& id) const;

    const std::vector<Cell>& cells() const { return cells_; }
    size_t cellCount() const { return cells_.size(); }

    bool operator==(const GraphModel& o) const;
    bool operator!=(const GraphModel& o) const { return !(*this == o); }

private:
    std::vector<Cell> cells_;
};

}  // namespace mxdiagram
