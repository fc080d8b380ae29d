#pragma once

#include "../core/GraphModel.h"

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace mxdiagram {

/// Thrown when input is not well-formed XML or has no <mxGraphModel> root
class MxGraphParseError : public std::runtime_error {
public:
    explicit MxGraphParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Decodes an uncompressed <mxGraphModel> document back into a GraphModel
///
/// Decoding is lenient past the document element: unknown elements and
/// attributes are skipped, numeric attributes that are not integers read
/// as 0, and style attributes go through Style::decode(). No referential
/// checks are made.
class MxGraphXmlReader {
public:
    /// @throws MxGraphParseError on malformed input
    static GraphModel fromString(const std::string& xml);

    /// @throws MxGraphParseError on malformed input
    static GraphModel fromStream(std::istream& in);

    /// Load a model from a file, logging the failure reason
    /// @return nullopt if the file cannot be read or parsed
    static std::optional<GraphModel> loadFromFile(const std::string& path);
};

}  // namespace mxdiagram
