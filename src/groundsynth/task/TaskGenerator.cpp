#include "task/TaskGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace GS {

auto waitTargetModeToString(WaitTargetMode mode) -> std::string_view {
    switch (mode) {
    case WaitTargetMode::None:
        return "none";
    case WaitTargetMode::Indicator:
        return "indicator";
    }
    return "none";
}

auto parseWaitTargetMode(std::string_view text) -> std::optional<WaitTargetMode> {
    if (text == "none")
        return WaitTargetMode::None;
    if (text == "indicator")
        return WaitTargetMode::Indicator;
    return std::nullopt;
}

auto spatialTargetFor(PixelRect const& bounds, RenderedSurface const& surface, double toleranceScale)
    -> Expected<SpatialTarget> {
    if (!(toleranceScale > 0.0)) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "tolerance scale must be positive, got " + std::to_string(toleranceScale)));
    }
    auto local = surface.mapFromFrame(bounds);
    if (!local)
        return std::unexpected(local.error());

    auto point = normalizePoint(local->center(), surface.ref);
    if (!point)
        return std::unexpected(point.error());
    auto half = normalizeExtent(PixelSize{local->width / 2, local->height / 2}, surface.ref);
    if (!half)
        return std::unexpected(half.error());

    auto scaled = [toleranceScale](int units) {
        return std::max(1, static_cast<int>(std::lround(units * toleranceScale)));
    };
    return SpatialTarget{*point, UnitPair{scaled(half->x), scaled(half->y)}};
}

auto fixedTargetFor(PixelRect const& bounds, RenderedSurface const& surface, int tolerancePixels)
    -> Expected<SpatialTarget> {
    if (tolerancePixels < 1) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "test tolerance must be at least one pixel, got "
                                             + std::to_string(tolerancePixels)));
    }
    auto local = surface.mapFromFrame(bounds);
    if (!local)
        return std::unexpected(local.error());
    auto point = normalizePoint(local->center(), surface.ref);
    if (!point)
        return std::unexpected(point.error());
    auto tolerance = normalizeExtent(PixelSize{tolerancePixels, tolerancePixels}, surface.ref);
    if (!tolerance)
        return std::unexpected(tolerance.error());
    return SpatialTarget{*point, UnitPair{std::max(1, tolerance->x), std::max(1, tolerance->y)}};
}

auto sceneMetadata(SceneState const& scene) -> nlohmann::json {
    auto icons = [](std::vector<IconPlacement> const& placements) {
        auto list = nlohmann::json::array();
        for (auto const& icon : placements) {
            list.push_back({{"id", icon.elementId},
                            {"label", icon.label},
                            {"bbox", {icon.bounds.x, icon.bounds.y, icon.bounds.width, icon.bounds.height}}});
        }
        return list;
    };
    return nlohmann::json{
        {"date", scene.datetime.isoDate()},
        {"minute_of_day", scene.datetime.minuteOfDay},
        {"clock", scene.datetime.displayText()},
        {"loading_visible", scene.loadingVisible},
        {"desktop_icons", icons(scene.desktopIcons)},
        {"taskbar_icons", icons(scene.taskbarIcons)},
        {"lineage",
         {{"seed", scene.lineage.seed}, {"scene_index", scene.lineage.sceneIndex}, {"draws_before", scene.lineage.drawsBefore}}},
    };
}

auto makeSampleId(std::string_view kind, std::uint64_t sceneIndex, std::string_view suffix) -> std::string {
    char index[24];
    std::snprintf(index, sizeof(index), "%05llu", static_cast<unsigned long long>(sceneIndex));
    std::string id(kind);
    id.push_back('_');
    id.append(index);
    if (!suffix.empty()) {
        id.push_back('_');
        id.append(suffix);
    }
    return id;
}

} // namespace GS
