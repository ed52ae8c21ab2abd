#pragma once

#include "core/Error.hpp"
#include "geometry/Geometry.hpp"
#include "layout/LayoutCatalog.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace GS {

[[nodiscard]] auto parseIsoDate(std::string_view text) -> Expected<std::chrono::sys_days>;
[[nodiscard]] auto formatIsoDate(std::chrono::sys_days day) -> std::string;

struct SceneDateTime {
    std::chrono::sys_days day{};
    int                   minuteOfDay = 0;

    [[nodiscard]] auto isoDate() const -> std::string { return formatIsoDate(day); }
    // Taskbar clock text: "h:mm AM" over "M/D/YYYY".
    [[nodiscard]] auto displayText() const -> std::string;
};

struct IconPlacement {
    std::string elementId;
    IconGroup   group = IconGroup::Desktop;
    std::string label;
    PixelRect   bounds;
};

struct RngLineage {
    std::uint64_t seed        = 0;
    std::uint64_t sceneIndex  = 0;
    std::uint64_t drawsBefore = 0;
};

/**
 * One concrete scene configuration.
 *
 * Produced by SceneSampler for a single generation call and only read afterwards.
 * The scene date doubles as the disjointness key of every sample rendered from it.
 */
struct SceneState {
    std::vector<IconPlacement> desktopIcons;
    std::vector<IconPlacement> taskbarIcons;
    SceneDateTime              datetime;
    bool                       loadingVisible = false;
    RngLineage                 lineage;

    [[nodiscard]] auto icons(IconGroup group) const -> std::vector<IconPlacement> const& {
        return group == IconGroup::Desktop ? desktopIcons : taskbarIcons;
    }
    [[nodiscard]] auto findIcon(IconGroup group, std::string_view id) const -> IconPlacement const*;
    [[nodiscard]] auto disjointnessKey() const -> std::string { return datetime.isoDate(); }
};

} // namespace GS
