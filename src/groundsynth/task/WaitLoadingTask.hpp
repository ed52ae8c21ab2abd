#pragma once

#include "layout/LayoutCatalog.hpp"
#include "task/TaskGenerator.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>

namespace GS {

inline constexpr std::array<std::string_view, 3> kLoadingPrompts = {
    "A loading screen is visible. What action should you take?",
    "The application is loading. What should you do?",
    "Open Dental is starting up. What action is appropriate?",
};

/**
 * Wait samples for scenes that show the loading panel.
 *
 * Emits one sample per loading scene and nothing otherwise. Depending on
 * TaskOptions::waitTarget the action either points at the panel or carries
 * the no-target marker; it never carries a made-up (0,0) target. Test cases
 * draw nothing: they ask for TaskOptions::testWaitSeconds by name.
 */
class WaitLoadingTask final : public TaskGenerator {
public:
    WaitLoadingTask(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions options);

    [[nodiscard]] auto kind() const -> std::string_view override;
    [[nodiscard]] auto forcedLoading() const -> std::optional<bool> override { return true; }
    [[nodiscard]] auto generate(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;
    [[nodiscard]] auto generateTest(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;

private:
    auto emit(SceneState const& scene, RenderedFrame const& frame, std::string prompt, int seconds, bool testCase) const
        -> Expected<std::vector<TrainingSample>>;
    auto loadingPanel() const -> Expected<LayoutElement const*>;

    std::shared_ptr<const LayoutCatalog> catalog_;
    TaskOptions                          options_;
};

} // namespace GS
