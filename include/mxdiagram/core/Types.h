#pragma once

#include <optional>
#include <string>
#include <utility>

namespace mxdiagram {

/// Id of the canvas root cell every document starts with
inline constexpr const char* kCanvasRootId = "0";

/// Id of the default layer cell, parented to the canvas root
inline constexpr const char* kDefaultLayerId = "1";

/// Value written to `vertex` / `edge` when the flag is set
inline constexpr const char* kFlagSet = "1";

/// `as` labels understood by the editor
inline constexpr const char* kGeometryAs = "geometry";
inline constexpr const char* kSourcePointAs = "sourcePoint";
inline constexpr const char* kTargetPointAs = "targetPoint";

/// Labeled coordinate inside a Geometry (<mxPoint>)
///
/// For edges the label tells which end of the connector the point
/// describes: kSourcePointAs or kTargetPointAs.
struct MxPoint {
    int x = 0;   ///< Omitted from output when 0
    int y = 0;   ///< Omitted from output when 0
    std::string as;

    MxPoint() = default;
    MxPoint(int x_, int y_, std::string as_) : x(x_), y(y_), as(std::move(as_)) {}

    bool operator==(const MxPoint& o) const { return x == o.x && y == o.y && as == o.as; }
    bool operator!=(const MxPoint& o) const { return !(*this == o); }
};

/// Position and size of a shape, or endpoint description of an edge (<mxGeometry>)
///
/// Width and height are kept as strings because the file format stores them
/// verbatim (the editor accepts fractional values such as "120.5").
struct Geometry {
    int x = 0;                 ///< Omitted from output when 0
    int y = 0;                 ///< Omitted from output when 0
    std::string width;         ///< Omitted when empty
    std::string height;        ///< Omitted when empty
    std::string relative;      ///< "1" for edge geometries, omitted when empty
    std::string as = kGeometryAs;
    std::optional<MxPoint> point;

    bool operator==(const Geometry& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height &&
               relative == o.relative && as == o.as && point == o.point;
    }
    bool operator!=(const Geometry& o) const { return !(*this == o); }
};

}  // namespace mxdiagram
