#pragma once

#include "core/Error.hpp"
#include "geometry/Coordinates.hpp"
#include "layout/LayoutCatalog.hpp"
#include "render/RenderedSurface.hpp"
#include "scene/SceneState.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace GS {

struct CropDeclaration {
    SurfaceId id;
    PixelRect bounds;
};

/**
 * Boundary to the rendering engine.
 *
 * Implementations return the full frame at the exact pixel size they rendered,
 * plus every crop listed by declaredCrops(). Callers normalise coordinates with
 * those sizes, never with an assumed screen constant.
 */
class SceneRenderer {
public:
    virtual ~SceneRenderer() = default;

    [[nodiscard]] virtual auto render(SceneState const& scene, LayoutCatalog const& catalog) const
        -> Expected<RenderedFrame> = 0;
    [[nodiscard]] virtual auto declaredCrops() const -> std::vector<CropDeclaration> const& = 0;
};

using Rgba = std::array<std::uint8_t, 4>;

struct SchematicPalette {
    Rgba background    = {0x1f, 0x4e, 0x8c, 0xff};
    Rgba taskbar       = {0xe8, 0xec, 0xf2, 0xff};
    Rgba desktopIcon   = {0xf2, 0xb1, 0x34, 0xff};
    Rgba taskbarIcon   = {0x3a, 0x7b, 0xd5, 0xff};
    Rgba loadingPanel  = {0xfa, 0xfa, 0xfa, 0xff};
    Rgba loadingAccent = {0x2b, 0x9c, 0x5c, 0xff};
    Rgba text          = {0x10, 0x10, 0x10, 0xff};
};

/**
 * Flat-colour stand-in for the production compositor.
 *
 * Paints regions, placed icons, the loading panel and a date bar code so that
 * every scene attribute leaves a visible trace. Declares one crop per layout
 * region flagged "crop".
 */
class SchematicRenderer final : public SceneRenderer {
public:
    explicit SchematicRenderer(LayoutCatalog const& catalog, SchematicPalette palette = {});

    [[nodiscard]] auto render(SceneState const& scene, LayoutCatalog const& catalog) const
        -> Expected<RenderedFrame> override;
    [[nodiscard]] auto declaredCrops() const -> std::vector<CropDeclaration> const& override { return crops_; }

private:
    SchematicPalette             palette_;
    std::vector<CropDeclaration> crops_;
};

} // namespace GS
