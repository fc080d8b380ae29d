#include "mxdiagram/validation/ModelValidator.h"
#include "mxdiagram/common/Logger.h"
#include "mxdiagram/core/GraphModel.h"

#include <sstream>
#include <unordered_set>

namespace mxdiagram {

const char* modelViolationTypeToString(ModelViolationType type) {
    switch (type) {
        case ModelViolationType::MissingCanvasRoot:
            return "MissingCanvasRoot";
        case ModelViolationType::MissingDefaultLayer:
            return "MissingDefaultLayer";
        case ModelViolationType::DuplicateId:
            return "DuplicateId";
        case ModelViolationType::DanglingParent:
            return "DanglingParent";
        case ModelViolationType::DanglingSource:
            return "DanglingSource";
        case ModelViolationType::DanglingTarget:
            return "DanglingTarget";
        case ModelViolationType::VertexAndEdge:
            return "VertexAndEdge";
        default:
            return "Unknown";
    }
}

std::string ModelViolation::toString() const {
    std::ostringstream oss;
    oss << "[" << modelViolationTypeToString(type) << "]";
    if (cellIndex >= 0) {
        oss << " cell #" << cellIndex << " '" << cellId << "'";
    }
    if (!reference.empty()) {
        oss << " -> '" << reference << "'";
    }
    return oss.str();
}

std::vector<ModelViolation> ModelValidator::validate(const GraphModel& model) {
    std::vector<ModelViolation> violations;
    const auto& cells = model.cells();

    if (cells.empty() || cells[0].id != kCanvasRootId || !cells[0].parentId.empty()) {
        ModelViolation v{ModelViolationType::MissingCanvasRoot};
        if (!cells.empty()) {
            v.cellId = cells[0].id;
            v.cellIndex = 0;
        }
        violations.push_back(v);
    }
    if (cells.size() < 2 || cells[1].id != kDefaultLayerId || cells[1].parentId != kCanvasRootId) {
        ModelViolation v{ModelViolationType::MissingDefaultLayer};
        if (cells.size() >= 2) {
            v.cellId = cells[1].id;
            v.cellIndex = 1;
        }
        violations.push_back(v);
    }

    std::unordered_set<std::string> ids;
    for (const auto& cell : cells) {
        ids.insert(cell.id);
    }

    auto dangling = [&ids](const std::string& ref) {
        return !ref.empty() && ids.find(ref) == ids.end();
    };

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < cells.size(); ++i) {
        const Cell& cell = cells[i];
        int index = static_cast<int>(i);

        if (!seen.insert(cell.id).second) {
            violations.push_back({ModelViolationType::DuplicateId, cell.id, index, ""});
        }
        if (dangling(cell.parentId)) {
            violations.push_back({ModelViolationType::DanglingParent, cell.id, index, cell.parentId});
        }
        if (dangling(cell.source)) {
            violations.push_back({ModelViolationType::DanglingSource, cell.id, index, cell.source});
        }
        if (dangling(cell.target)) {
            violations.push_back({ModelViolationType::DanglingTarget, cell.id, index, cell.target});
        }
        if (cell.isVertex() && cell.isEdge()) {
            violations.push_back({ModelViolationType::VertexAndEdge, cell.id, index, ""});
        }
    }

    if (!violations.empty()) {
        LOG_DEBUG("Model validation found {} violations", violations.size());
    }
    return violations;
}

}  // namespace mxdiagram
