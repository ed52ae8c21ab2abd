#pragma once

#include "core/Error.hpp"
#include "geometry/Coordinates.hpp"
#include "geometry/Geometry.hpp"
#include "render/ImageIo.hpp"

#include <string_view>
#include <vector>

namespace GS {

/**
 * An image as the renderer produced it.
 *
 * `frameBounds` is where the surface sits in the full frame; for the full-frame
 * surface it is the whole frame. Pixel rects from the layout are in frame space
 * and must go through mapFromFrame before they describe this surface.
 */
struct RenderedSurface {
    SurfaceRef    ref;
    PixelRect     frameBounds;
    SoftwareImage image;

    [[nodiscard]] auto isFullFrame() const -> bool { return ref.id == fullFrameSurfaceId(); }
    [[nodiscard]] auto mapFromFrame(PixelRect const& rect) const -> Expected<PixelRect>;
};

class RenderedFrame {
public:
    explicit RenderedFrame(RenderedSurface full);

    [[nodiscard]] auto fullFrame() const -> RenderedSurface const& { return surfaces_.front(); }
    [[nodiscard]] auto surfaces() const -> std::vector<RenderedSurface> const& { return surfaces_; }
    [[nodiscard]] auto surface(SurfaceId const& id) const -> Expected<RenderedSurface const*>;

    auto addCrop(SurfaceId id, PixelRect const& rect) -> Expected<void>;

private:
    std::vector<RenderedSurface> surfaces_;
};

// Copies `rect` out of the full-frame surface; fails when rect leaves the frame.
[[nodiscard]] auto makeCrop(RenderedSurface const& full, SurfaceId id, PixelRect const& rect) -> Expected<RenderedSurface>;

} // namespace GS
