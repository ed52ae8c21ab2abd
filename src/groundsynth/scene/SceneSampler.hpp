#pragma once

#include "core/Error.hpp"
#include "layout/LayoutCatalog.hpp"
#include "scene/Rng.hpp"
#include "scene/SceneState.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace GS {

enum class PlacementMode {
    Authored, // icons sit at their catalog bounds
    Flow      // selected icons are shuffled and packed on the region's flow grid
};

struct SamplerContext {
    double                             desktopMinFrac     = 0.6;
    double                             taskbarMinFrac     = 0.4;
    double                             loadingProbability = 0.5;
    std::optional<bool>                forceLoading;
    std::chrono::sys_days              dateStart{};
    std::chrono::sys_days              dateEnd{};
    std::vector<std::chrono::sys_days> allowedDays; // overrides [dateStart, dateEnd] when non-empty
    PlacementMode                      placement  = PlacementMode::Authored;
    std::uint64_t                      sceneIndex = 0;
};

// Size of the optional subset: uniform over [ceil(optionalCount * minFrac), optionalCount].
[[nodiscard]] auto drawSubsetSize(Rng& rng, std::size_t optionalCount, double minFrac) -> Expected<std::size_t>;

// Vary-N selection: required ∪ (k-subset of optional), in catalog order.
[[nodiscard]] auto selectSubset(Rng&                                     rng,
                                std::vector<LayoutElement const*> const& required,
                                std::vector<LayoutElement const*> const& optional,
                                double                                   minFrac)
    -> Expected<std::vector<LayoutElement const*>>;

class SceneSampler {
public:
    [[nodiscard]] auto sample(Rng& rng, LayoutCatalog const& catalog, SamplerContext const& context) const
        -> Expected<SceneState>;

private:
    [[nodiscard]] auto place(Rng&                                     rng,
                             LayoutCatalog const&                     catalog,
                             IconGroup                                group,
                             std::vector<LayoutElement const*> const& selection,
                             PlacementMode                            mode) const -> Expected<std::vector<IconPlacement>>;
    [[nodiscard]] auto drawDateTime(Rng& rng, SamplerContext const& context) const -> Expected<SceneDateTime>;
};

} // namespace GS
