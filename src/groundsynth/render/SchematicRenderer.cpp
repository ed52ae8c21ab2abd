#include "render/SceneRenderer.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstring>

namespace GS {
namespace {

auto fillRect(SoftwareImage& image, PixelRect const& rect, Rgba const& color) -> void {
    auto x0 = std::clamp(rect.x, 0, image.width);
    auto y0 = std::clamp(rect.y, 0, image.height);
    auto x1 = std::clamp(rect.right(), 0, image.width);
    auto y1 = std::clamp(rect.bottom(), 0, image.height);
    for (int y = y0; y < y1; ++y) {
        auto* row = image.pixels.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(image.width)) * 4u;
        for (int x = x0; x < x1; ++x)
            std::memcpy(row + static_cast<std::size_t>(x) * 4u, color.data(), 4);
    }
}

auto outlineRect(SoftwareImage& image, PixelRect const& rect, Rgba const& color) -> void {
    fillRect(image, PixelRect{rect.x, rect.y, rect.width, 1}, color);
    fillRect(image, PixelRect{rect.x, rect.bottom() - 1, rect.width, 1}, color);
    fillRect(image, PixelRect{rect.x, rect.y, 1, rect.height}, color);
    fillRect(image, PixelRect{rect.right() - 1, rect.y, 1, rect.height}, color);
}

auto darken(Rgba color) -> Rgba {
    return Rgba{static_cast<std::uint8_t>(color[0] / 2),
                static_cast<std::uint8_t>(color[1] / 2),
                static_cast<std::uint8_t>(color[2] / 2),
                color[3]};
}

// Writes `bits` of `value` as a row of cells across `area`, most significant first.
auto paintCode(SoftwareImage& image, PixelRect const& area, std::uint64_t value, int bits, int row, int rows, Rgba on)
    -> void {
    int cellWidth  = std::max(1, area.width / bits);
    int cellHeight = std::max(1, area.height / rows);
    for (int bit = 0; bit < bits; ++bit) {
        if ((value >> (bits - 1 - bit)) & 1u) {
            fillRect(image, PixelRect{area.x + bit * cellWidth, area.y + row * cellHeight, cellWidth, cellHeight}, on);
        }
    }
}

} // namespace

SchematicRenderer::SchematicRenderer(LayoutCatalog const& catalog, SchematicPalette palette)
    : palette_(palette) {
    for (auto const* region : catalog.cropRegions()) {
        crops_.push_back(CropDeclaration{SurfaceId{region->id}, region->bounds});
    }
}

auto SchematicRenderer::render(SceneState const& scene, LayoutCatalog const& catalog) const -> Expected<RenderedFrame> {
    auto const frameSize = catalog.frameSize();

    RenderedSurface full;
    full.ref         = SurfaceRef{fullFrameSurfaceId(), frameSize.width, frameSize.height};
    full.frameBounds = catalog.frameRect();
    full.image.width  = frameSize.width;
    full.image.height = frameSize.height;
    full.image.pixels.resize(static_cast<std::size_t>(frameSize.width) * static_cast<std::size_t>(frameSize.height) * 4u);
    fillRect(full.image, full.frameBounds, palette_.background);

    if (auto const* taskbar = catalog.regionFor(IconGroup::Taskbar))
        fillRect(full.image, taskbar->bounds, palette_.taskbar);

    for (auto group : {IconGroup::Desktop, IconGroup::Taskbar}) {
        auto const& color = group == IconGroup::Desktop ? palette_.desktopIcon : palette_.taskbarIcon;
        for (auto const& icon : scene.icons(group)) {
            if (!catalog.frameRect().contains(icon.bounds)) {
                return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                                 "icon '" + icon.elementId + "' " + describeRect(icon.bounds)
                                                     + " is outside the frame"));
            }
            fillRect(full.image, icon.bounds, color);
            outlineRect(full.image, icon.bounds, darken(color));
        }
    }

    if (auto const* clock = catalog.datetimeArea()) {
        auto days = static_cast<std::uint64_t>(scene.datetime.day.time_since_epoch().count());
        paintCode(full.image, clock->bounds, days, 16, 0, 2, palette_.text);
        paintCode(full.image, clock->bounds, static_cast<std::uint64_t>(scene.datetime.minuteOfDay), 11, 1, 2,
                  palette_.text);
    }

    if (scene.loadingVisible) {
        auto const* panel = catalog.loadingIndicator();
        if (panel == nullptr) {
            return std::unexpected(
                makeError(Error::Code::ConfigurationError, "scene shows a loading panel but the layout declares none"));
        }
        fillRect(full.image, panel->bounds, palette_.loadingPanel);
        auto const& b = panel->bounds;
        fillRect(full.image, PixelRect{b.x + b.width / 8, b.y + b.height * 3 / 4, b.width * 3 / 4, std::max(2, b.height / 20)},
                 palette_.loadingAccent);
        outlineRect(full.image, b, darken(palette_.loadingPanel));
    }

    RenderedFrame frame(std::move(full));
    for (auto const& crop : crops_) {
        if (auto added = frame.addCrop(crop.id, crop.bounds); !added)
            return std::unexpected(added.error());
    }
    gs_log("Rendered scene " + std::to_string(scene.lineage.sceneIndex) + " with "
               + std::to_string(frame.surfaces().size()) + " surfaces",
           "Render", "INFO");
    return frame;
}

} // namespace GS
