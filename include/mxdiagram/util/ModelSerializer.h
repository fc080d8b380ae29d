#pragma once

#include <string>

namespace mxdiagram {

class GraphModel;

/// JSON snapshot of a GraphModel
///
/// Handy for fixtures and for tooling that prefers JSON over the editor's
/// XML. Style is stored as an object, geometry and point as nested
/// objects that are left out when the cell has none.
class ModelSerializer {
public:
    /// Serialize a model to an indented JSON string
    static std::string toJson(const GraphModel& model);

    /// Rebuild a model from JSON produced by toJson()
    /// @throws std::runtime_error if parsing fails
    static GraphModel fromJson(const std::string& json);

    /// @return true if the file was written
    static bool saveToFile(const GraphModel& model, const std::string& path);

    /// @param model Receives the loaded model; untouched on failure
    /// @return true if the file was read and parsed
    static bool loadFromFile(GraphModel& model, const std::string& path);
};

}  // namespace mxdiagram
