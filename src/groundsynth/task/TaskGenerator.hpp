#pragma once

#include "core/Error.hpp"
#include "geometry/Coordinates.hpp"
#include "render/RenderedSurface.hpp"
#include "sample/TrainingSample.hpp"
#include "scene/Rng.hpp"
#include "scene/SceneState.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GS {

enum class WaitTargetMode {
    None,     // wait samples carry the no-target marker
    Indicator // wait samples point at the loading panel
};

[[nodiscard]] auto waitTargetModeToString(WaitTargetMode mode) -> std::string_view;
[[nodiscard]] auto parseWaitTargetMode(std::string_view text) -> std::optional<WaitTargetMode>;

struct TaskOptions {
    double         toleranceScale = 1.0;
    WaitTargetMode waitTarget     = WaitTargetMode::None;
    int            waitMinSeconds = 1;
    int            waitMaxSeconds = 5;

    // Held-out test cases use fixed values instead of sampled ones.
    int desktopTestTolerancePixels = 20;
    int taskbarTestTolerancePixels = 10;
    int testWaitSeconds            = 3;
};

/**
 * Turns one sampled scene and its rendered frame into training samples.
 *
 * Generators never render and never write files; the image path of every
 * returned sample is left for the assembler to fill in. A generator may draw
 * from the run Rng, but only in a fixed order so that runs stay reproducible.
 */
class TaskGenerator {
public:
    virtual ~TaskGenerator() = default;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;

    // Scenes for this kind are sampled with the loading flag forced to this value.
    [[nodiscard]] virtual auto forcedLoading() const -> std::optional<bool> { return std::nullopt; }

    [[nodiscard]] virtual auto generate(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> = 0;

    // Held-out test cases for a test-split scene. Defaults to the training samples.
    [[nodiscard]] virtual auto generateTest(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> {
        return generate(scene, frame, rng);
    }
};

struct SpatialTarget {
    SurfacePoint point;
    UnitPair     tolerance;
};

// Normalised centre and half-extent of `bounds` on `surface`, tolerance scaled and at least one unit.
[[nodiscard]] auto spatialTargetFor(PixelRect const& bounds, RenderedSurface const& surface, double toleranceScale)
    -> Expected<SpatialTarget>;

// Normalised centre of `bounds` with a fixed pixel tolerance converted to units (at least one unit).
[[nodiscard]] auto fixedTargetFor(PixelRect const& bounds, RenderedSurface const& surface, int tolerancePixels)
    -> Expected<SpatialTarget>;

// Scene ground truth and Rng lineage shared by the metadata of every sample of a scene.
[[nodiscard]] auto sceneMetadata(SceneState const& scene) -> nlohmann::json;

// "<kind>_<scene index, 5 digits>_<suffix>"
[[nodiscard]] auto makeSampleId(std::string_view kind, std::uint64_t sceneIndex, std::string_view suffix) -> std::string;

} // namespace GS
