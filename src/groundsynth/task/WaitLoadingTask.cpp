#include "task/WaitLoadingTask.hpp"

#include "log/TaggedLogger.hpp"
#include "task/TaskRegistry.hpp"

namespace GS {

WaitLoadingTask::WaitLoadingTask(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions options)
    : catalog_(std::move(catalog)), options_(options) {}

auto WaitLoadingTask::kind() const -> std::string_view {
    return kWaitLoadingKind;
}

auto WaitLoadingTask::loadingPanel() const -> Expected<LayoutElement const*> {
    auto const* panel = catalog_->loadingIndicator();
    if (panel == nullptr) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "layout '" + catalog_->screenName() + "' has no loading indicator"));
    }
    return panel;
}

auto WaitLoadingTask::generate(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
    -> Expected<std::vector<TrainingSample>> {
    if (!scene.loadingVisible)
        return std::vector<TrainingSample>{};

    if (options_.waitMinSeconds < 1 || options_.waitMaxSeconds < options_.waitMinSeconds) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "wait range [" + std::to_string(options_.waitMinSeconds) + ", "
                                             + std::to_string(options_.waitMaxSeconds) + "] is invalid"));
    }
    if (auto panel = loadingPanel(); !panel)
        return std::unexpected(panel.error());

    // Draw order is fixed: prompt, then duration.
    auto const prompt  = kLoadingPrompts[rng.uniformIndex(kLoadingPrompts.size())];
    auto const seconds = rng.uniformInt(options_.waitMinSeconds, options_.waitMaxSeconds);
    return emit(scene, frame, std::string(prompt), seconds, false);
}

auto WaitLoadingTask::generateTest(SceneState const& scene, RenderedFrame const& frame, Rng&) const
    -> Expected<std::vector<TrainingSample>> {
    if (!scene.loadingVisible)
        return std::vector<TrainingSample>{};
    if (options_.testWaitSeconds < 1) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "test wait must be at least one second, got "
                                             + std::to_string(options_.testWaitSeconds)));
    }
    auto const seconds = options_.testWaitSeconds;
    return emit(scene, frame, "Wait for " + std::to_string(seconds) + " seconds.", seconds, true);
}

auto WaitLoadingTask::emit(SceneState const& scene, RenderedFrame const& frame, std::string prompt, int seconds, bool testCase) const
    -> Expected<std::vector<TrainingSample>> {
    auto panel = loadingPanel();
    if (!panel)
        return std::unexpected(panel.error());

    auto const& full = frame.fullFrame();
    SampleDraft draft;
    draft.id                     = makeSampleId(kind(), scene.lineage.sceneIndex, "wait");
    draft.taskKind               = std::string(kind());
    draft.prompt                 = std::move(prompt);
    draft.action.kind            = ActionKind::Wait;
    draft.action.durationSeconds = static_cast<double>(seconds);
    draft.image.surface          = full.ref;
    draft.disjointnessKey        = scene.disjointnessKey();

    if (options_.waitTarget == WaitTargetMode::Indicator) {
        auto target = spatialTargetFor((*panel)->bounds, full, options_.toleranceScale);
        if (!target)
            return std::unexpected(target.error());
        draft.action.coordinate = target->point;
        draft.action.tolerance  = target->tolerance;
    } else {
        draft.action.tolerance = NoSpatialTarget{};
    }
    draft.metadata = {
        {"wait_seconds", seconds},
        {"loading_panel", (*panel)->id},
        {"wait_target", std::string(waitTargetModeToString(options_.waitTarget))},
        {"test_case", testCase},
        {"ground_truth", sceneMetadata(scene)},
    };

    auto sample = TrainingSample::make(std::move(draft));
    if (!sample)
        return std::unexpected(sample.error());
    gs_log("wait-loading: scene " + std::to_string(scene.lineage.sceneIndex) + " waits " + std::to_string(seconds) + "s",
           "Task", "INFO");
    std::vector<TrainingSample> samples;
    samples.push_back(std::move(*sample));
    return samples;
}

} // namespace GS
