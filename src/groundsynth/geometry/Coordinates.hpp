#pragma once

#include "core/Error.hpp"
#include "geometry/Geometry.hpp"

#include <string>
#include <string_view>

namespace GS {

inline constexpr int kUnitScale = 1000;

/**
 * Identity of a render surface ("full", or the id of a declared crop).
 *
 * Coordinates and images both carry one, so a coordinate computed against a crop
 * cannot be attached to a full-frame image without the mismatch being detected.
 */
class SurfaceId {
public:
    SurfaceId() = default;
    explicit SurfaceId(std::string value)
        : value_(std::move(value)) {}

    [[nodiscard]] auto str() const -> std::string const& { return value_; }
    [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

    friend bool operator==(SurfaceId const&, SurfaceId const&) = default;

private:
    std::string value_;
};

[[nodiscard]] inline auto fullFrameSurfaceId() -> SurfaceId {
    return SurfaceId{"full"};
}

struct SurfaceRef {
    SurfaceId id;
    int       width  = 0;
    int       height = 0;

    [[nodiscard]] auto size() const -> PixelSize { return PixelSize{width, height}; }

    friend bool operator==(SurfaceRef const&, SurfaceRef const&) = default;
};

// Unit-space pair in [0, kUnitScale]; deliberately not convertible from PixelPoint.
struct UnitPair {
    int x = 0;
    int y = 0;

    friend bool operator==(UnitPair const&, UnitPair const&) = default;
};

struct SurfacePoint {
    SurfaceId surface;
    UnitPair  units;

    friend bool operator==(SurfacePoint const&, SurfacePoint const&) = default;
};

[[nodiscard]] auto toUnits(double pixel, int surfaceDim) -> Expected<int>;
[[nodiscard]] auto toPixel(int units, int surfaceDim) -> Expected<int>;

// Largest |toPixel(toUnits(p, d), d) - p| the rounding can produce.
[[nodiscard]] constexpr auto roundTripSlack(int surfaceDim) -> int {
    return (surfaceDim + 2 * kUnitScale - 1) / (2 * kUnitScale);
}

[[nodiscard]] auto normalizePoint(PixelPoint point, SurfaceRef const& surface) -> Expected<SurfacePoint>;
[[nodiscard]] auto normalizeExtent(PixelSize halfExtent, SurfaceRef const& surface) -> Expected<UnitPair>;
[[nodiscard]] auto denormalizePoint(SurfacePoint const& point, SurfaceRef const& surface) -> Expected<PixelPoint>;

[[nodiscard]] auto inUnitRange(UnitPair const& pair) -> bool;

} // namespace GS
