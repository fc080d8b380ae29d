#pragma once

#include <string>
#include <vector>

namespace mxdiagram {

class GraphModel;

/// Kinds of referential problems that keep the editor from opening a model
enum class ModelViolationType {
    /// First cell is not id "0" without a parent
    MissingCanvasRoot,

    /// Second cell is not id "1" parented to "0"
    MissingDefaultLayer,

    /// Two or more cells share an id
    DuplicateId,

    /// parent does not name any cell in the model
    DanglingParent,

    /// source does not name any cell in the model
    DanglingSource,

    /// target does not name any cell in the model
    DanglingTarget,

    /// Both vertex and edge are set
    VertexAndEdge
};

/// One problem found by ModelValidator
struct ModelViolation {
    ModelViolationType type;

    /// Id of the offending cell (empty for structural violations on an empty model)
    std::string cellId;

    /// Index of the offending cell in GraphModel::cells(), or -1
    int cellIndex = -1;

    /// The id that failed to resolve, for the dangling reference kinds
    std::string reference;

    std::string toString() const;
};

const char* modelViolationTypeToString(ModelViolationType type);

/// Opt-in referential integrity check
///
/// GraphModel accepts anything; run this pass before writing a file when
/// ids come from an external source. The model is never modified.
class ModelValidator {
public:
    /// @return violations in cell order, empty if the model is well formed
    static std::vector<ModelViolation> validate(const GraphModel& model);

    static bool isValid(const GraphModel& model) { return validate(model).empty(); }
};

}  // namespace mxdiagram
