#include "scene/SceneSampler.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace GS {

auto drawSubsetSize(Rng& rng, std::size_t optionalCount, double minFrac) -> Expected<std::size_t> {
    if (!(minFrac >= 0.0 && minFrac <= 1.0)) {
        return std::unexpected(
            makeError(Error::Code::InvalidArgument, "min_frac must lie in [0, 1], got " + std::to_string(minFrac)));
    }
    if (optionalCount == 0)
        return std::size_t{0};
    // The epsilon keeps 5 * 0.6 from rounding up to 4.
    auto lower = static_cast<std::size_t>(std::ceil(static_cast<double>(optionalCount) * minFrac - 1e-9));
    lower      = std::min(lower, optionalCount);
    return static_cast<std::size_t>(
        rng.uniformInt(static_cast<std::int64_t>(lower), static_cast<std::int64_t>(optionalCount)));
}

auto selectSubset(Rng&                                     rng,
                  std::vector<LayoutElement const*> const& required,
                  std::vector<LayoutElement const*> const& optional,
                  double                                   minFrac) -> Expected<std::vector<LayoutElement const*>> {
    auto k = drawSubsetSize(rng, optional.size(), minFrac);
    if (!k)
        return std::unexpected(k.error());
    auto picks = rng.sampleWithoutReplacement(optional.size(), *k);
    if (!picks)
        return std::unexpected(picks.error());

    std::vector<LayoutElement const*> selection(required.begin(), required.end());
    for (auto index : *picks)
        selection.push_back(optional[index]);
    // All pointers come from the same catalog vector, so this restores catalog order.
    std::sort(selection.begin(), selection.end(), std::less<LayoutElement const*>{});
    return selection;
}

auto SceneSampler::sample(Rng& rng, LayoutCatalog const& catalog, SamplerContext const& context) const
    -> Expected<SceneState> {
    SceneState state;
    state.lineage = RngLineage{.seed = rng.seed(), .sceneIndex = context.sceneIndex, .drawsBefore = rng.draws()};

    auto desktop = selectSubset(rng,
                                catalog.requiredIcons(IconGroup::Desktop),
                                catalog.optionalIcons(IconGroup::Desktop),
                                context.desktopMinFrac);
    if (!desktop)
        return std::unexpected(desktop.error());
    auto taskbar = selectSubset(rng,
                                catalog.requiredIcons(IconGroup::Taskbar),
                                catalog.optionalIcons(IconGroup::Taskbar),
                                context.taskbarMinFrac);
    if (!taskbar)
        return std::unexpected(taskbar.error());

    auto desktopPlaced = place(rng, catalog, IconGroup::Desktop, *desktop, context.placement);
    if (!desktopPlaced)
        return std::unexpected(desktopPlaced.error());
    auto taskbarPlaced = place(rng, catalog, IconGroup::Taskbar, *taskbar, context.placement);
    if (!taskbarPlaced)
        return std::unexpected(taskbarPlaced.error());
    state.desktopIcons = std::move(*desktopPlaced);
    state.taskbarIcons = std::move(*taskbarPlaced);

    // Always drawn so the stream position does not depend on forceLoading.
    bool loading         = rng.bernoulli(context.loadingProbability);
    state.loadingVisible = context.forceLoading.value_or(loading);

    auto datetime = drawDateTime(rng, context);
    if (!datetime)
        return std::unexpected(datetime.error());
    state.datetime = *datetime;

    gs_log("Scene " + std::to_string(context.sceneIndex) + ": " + std::to_string(state.desktopIcons.size())
               + " desktop, " + std::to_string(state.taskbarIcons.size()) + " taskbar, date "
               + state.datetime.isoDate() + (state.loadingVisible ? ", loading" : ""),
           "Sampler");
    return state;
}

auto SceneSampler::place(Rng&                                     rng,
                         LayoutCatalog const&                     catalog,
                         IconGroup                                group,
                         std::vector<LayoutElement const*> const& selection,
                         PlacementMode                            mode) const -> Expected<std::vector<IconPlacement>> {
    std::vector<IconPlacement> placements;
    placements.reserve(selection.size());
    for (auto const* element : selection) {
        placements.push_back(IconPlacement{element->id, group, element->label, element->bounds});
    }
    if (mode == PlacementMode::Authored)
        return placements;

    auto const* region = catalog.regionFor(group);
    if (region == nullptr || !region->flow) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "flow placement needs a " + std::string(iconGroupToString(group))
                                             + " region with a flow block"));
    }
    rng.shuffle(placements);

    auto const& flow      = *region->flow;
    PixelPoint  lineStart = flow.origin;
    PixelPoint  cursor    = flow.origin;
    for (auto& placement : placements) {
        PixelRect slot{cursor.x, cursor.y, placement.bounds.width, placement.bounds.height};
        if (!region->bounds.contains(slot)) {
            lineStart = PixelPoint{lineStart.x + flow.wrap.x, lineStart.y + flow.wrap.y};
            cursor    = lineStart;
            slot      = PixelRect{cursor.x, cursor.y, placement.bounds.width, placement.bounds.height};
            if ((flow.wrap.x == 0 && flow.wrap.y == 0) || !region->bounds.contains(slot)) {
                return std::unexpected(makeError(Error::Code::ConfigurationError,
                                                 "region '" + region->id + "' cannot fit "
                                                     + std::to_string(placements.size()) + " icons"));
            }
        }
        placement.bounds = slot;
        cursor           = PixelPoint{cursor.x + flow.advance.x, cursor.y + flow.advance.y};
    }
    return placements;
}

auto SceneSampler::drawDateTime(Rng& rng, SamplerContext const& context) const -> Expected<SceneDateTime> {
    SceneDateTime datetime;
    if (!context.allowedDays.empty()) {
        datetime.day = context.allowedDays[rng.uniformIndex(context.allowedDays.size())];
    } else {
        if (context.dateEnd < context.dateStart) {
            return std::unexpected(makeError(Error::Code::ConfigurationError, "date range ends before it starts"));
        }
        auto span    = (context.dateEnd - context.dateStart).count();
        datetime.day = context.dateStart + std::chrono::days{rng.uniformInt(0, span)};
    }
    datetime.minuteOfDay = static_cast<int>(rng.uniformInt(0, 24 * 60 - 1));
    return datetime;
}

} // namespace GS
