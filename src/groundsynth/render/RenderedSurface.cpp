#include "render/RenderedSurface.hpp"

#include <algorithm>
#include <cstring>

namespace GS {

auto RenderedSurface::mapFromFrame(PixelRect const& rect) const -> Expected<PixelRect> {
    if (!frameBounds.contains(rect)) {
        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                         "rect " + describeRect(rect) + " is not visible on surface '" + ref.id.str()
                                             + "' " + describeRect(frameBounds)));
    }
    return rect.translated(-frameBounds.x, -frameBounds.y);
}

RenderedFrame::RenderedFrame(RenderedSurface full) {
    surfaces_.push_back(std::move(full));
}

auto RenderedFrame::surface(SurfaceId const& id) const -> Expected<RenderedSurface const*> {
    auto it = std::find_if(surfaces_.begin(), surfaces_.end(), [&](RenderedSurface const& s) { return s.ref.id == id; });
    if (it == surfaces_.end()) {
        return std::unexpected(makeError(Error::Code::NotFound, "frame has no surface '" + id.str() + "'"));
    }
    return &*it;
}

auto RenderedFrame::addCrop(SurfaceId id, PixelRect const& rect) -> Expected<void> {
    if (surface(id))
        return std::unexpected(makeError(Error::Code::InvalidArgument, "surface '" + id.str() + "' already exists"));
    auto crop = makeCrop(fullFrame(), std::move(id), rect);
    if (!crop)
        return std::unexpected(crop.error());
    surfaces_.push_back(std::move(*crop));
    return {};
}

auto makeCrop(RenderedSurface const& full, SurfaceId id, PixelRect const& rect) -> Expected<RenderedSurface> {
    if (!full.image.valid())
        return std::unexpected(makeError(Error::Code::InvalidArgument, "cannot crop an empty frame"));
    PixelRect frame{0, 0, full.image.width, full.image.height};
    if (rect.empty() || !frame.contains(rect)) {
        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                         "crop '" + id.str() + "' " + describeRect(rect) + " lies outside the "
                                             + std::to_string(frame.width) + "x" + std::to_string(frame.height)
                                             + " frame"));
    }
    RenderedSurface crop;
    crop.ref         = SurfaceRef{std::move(id), rect.width, rect.height};
    crop.frameBounds = rect;
    crop.image.width  = rect.width;
    crop.image.height = rect.height;
    crop.image.pixels.resize(static_cast<std::size_t>(rect.width) * static_cast<std::size_t>(rect.height) * 4u);

    auto const srcStride = static_cast<std::size_t>(full.image.width) * 4u;
    auto const dstStride = static_cast<std::size_t>(rect.width) * 4u;
    for (int row = 0; row < rect.height; ++row) {
        auto const* src = full.image.pixels.data() + static_cast<std::size_t>(rect.y + row) * srcStride
                          + static_cast<std::size_t>(rect.x) * 4u;
        std::memcpy(crop.image.pixels.data() + static_cast<std::size_t>(row) * dstStride, src, dstStride);
    }
    return crop;
}

} // namespace GS
