#include "geometry/Coordinates.hpp"

#include <cmath>

namespace GS {

auto toUnits(double pixel, int surfaceDim) -> Expected<int> {
    if (surfaceDim <= 0) {
        return std::unexpected(makeError(Error::Code::InvalidArgument,
                                         "surface dimension must be positive, got " + std::to_string(surfaceDim)));
    }
    return static_cast<int>(std::lround(pixel / static_cast<double>(surfaceDim) * kUnitScale));
}

auto toPixel(int units, int surfaceDim) -> Expected<int> {
    if (surfaceDim <= 0) {
        return std::unexpected(makeError(Error::Code::InvalidArgument,
                                         "surface dimension must be positive, got " + std::to_string(surfaceDim)));
    }
    return static_cast<int>(std::lround(static_cast<double>(units) * surfaceDim / kUnitScale));
}

auto normalizePoint(PixelPoint point, SurfaceRef const& surface) -> Expected<SurfacePoint> {
    if (surface.id.empty()) {
        return std::unexpected(makeError(Error::Code::InvalidArgument, "surface has no id"));
    }
    if (point.x < 0 || point.y < 0 || point.x >= surface.width || point.y >= surface.height) {
        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                         "point (" + std::to_string(point.x) + "," + std::to_string(point.y)
                                             + ") lies outside surface '" + surface.id.str() + "' "
                                             + std::to_string(surface.width) + "x" + std::to_string(surface.height)));
    }
    auto x = toUnits(point.x, surface.width);
    if (!x)
        return std::unexpected(x.error());
    auto y = toUnits(point.y, surface.height);
    if (!y)
        return std::unexpected(y.error());
    return SurfacePoint{surface.id, UnitPair{*x, *y}};
}

auto normalizeExtent(PixelSize halfExtent, SurfaceRef const& surface) -> Expected<UnitPair> {
    if (halfExtent.width < 0 || halfExtent.height < 0) {
        return std::unexpected(makeError(Error::Code::InvalidArgument, "negative extent"));
    }
    auto x = toUnits(halfExtent.width, surface.width);
    if (!x)
        return std::unexpected(x.error());
    auto y = toUnits(halfExtent.height, surface.height);
    if (!y)
        return std::unexpected(y.error());
    return UnitPair{*x, *y};
}

auto denormalizePoint(SurfacePoint const& point, SurfaceRef const& surface) -> Expected<PixelPoint> {
    if (point.surface != surface.id) {
        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                         "coordinate belongs to surface '" + point.surface.str()
                                             + "' but was resolved against '" + surface.id.str() + "'"));
    }
    auto x = toPixel(point.units.x, surface.width);
    if (!x)
        return std::unexpected(x.error());
    auto y = toPixel(point.units.y, surface.height);
    if (!y)
        return std::unexpected(y.error());
    return PixelPoint{*x, *y};
}

auto inUnitRange(UnitPair const& pair) -> bool {
    return pair.x >= 0 && pair.x <= kUnitScale && pair.y >= 0 && pair.y <= kUnitScale;
}

} // namespace GS
