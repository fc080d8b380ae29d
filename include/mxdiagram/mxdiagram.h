#pragma once

/// @file mxdiagram.h
/// @brief Main header for the mxdiagram library
///
/// mxdiagram builds mxGraph diagram models in code and writes them as
/// files the draw.io / diagrams.net editor opens directly.
///
/// Example usage:
/// @code
/// #include <mxdiagram/mxdiagram.h>
///
/// mxdiagram::GraphModel model = mxdiagram::newGraph();
///
/// mxdiagram::Cell box = mxdiagram::newShape("box", mxdiagram::kDefaultLayerId);
/// box.value = "Hello";
/// box.style.set("rounded", "1");
/// model.add(box);
///
/// mxdiagram::MxGraphXmlExport xml;
/// xml.exportToFile(model, "hello.drawio");
/// @endcode

#include <string>

// Core module - diagram data model and builders
#include "core/Types.h"
#include "core/Style.h"
#include "core/Cell.h"
#include "core/GraphModel.h"
#include "core/Builders.h"

// Export / import - mxGraph XML file format
#include "export/IExporter.h"
#include "export/MxGraphXmlExport.h"
#include "import/MxGraphXmlReader.h"

// Utilities
#include "util/ModelSerializer.h"
#include "validation/ModelValidator.h"

namespace mxdiagram {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace mxdiagram
