#pragma once

#include "layout/LayoutCatalog.hpp"
#include "task/TaskGenerator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace GS {

/**
 * One double-click sample per icon of a group present in the scene.
 *
 * The coordinate is the icon centre normalised on the full-frame surface and
 * the tolerance is its half extent, so the sample is evaluated against the
 * exact image it ships with. Test cases cover the required icons only, with
 * the fixed per-group tolerance of TaskOptions.
 */
class IconClickTask final : public TaskGenerator {
public:
    IconClickTask(std::shared_ptr<const LayoutCatalog> catalog, IconGroup group, TaskOptions options);

    [[nodiscard]] auto kind() const -> std::string_view override;
    [[nodiscard]] auto forcedLoading() const -> std::optional<bool> override { return false; }
    [[nodiscard]] auto generate(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;
    [[nodiscard]] auto generateTest(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;

    [[nodiscard]] static auto promptFor(IconGroup group, std::string const& label) -> std::string;

private:
    auto emit(SceneState const& scene, RenderedFrame const& frame, bool testCases) const
        -> Expected<std::vector<TrainingSample>>;

    std::shared_ptr<const LayoutCatalog> catalog_;
    IconGroup                            group_;
    TaskOptions                          options_;
};

/**
 * Enumeration prompts over the visible desktop icons.
 *
 * Each sample lists every visible label in placement order and names one
 * target; the list is checked against the placement order before the sample
 * is emitted. Test cases only target required icons.
 */
class IconListTask final : public TaskGenerator {
public:
    IconListTask(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions options);

    [[nodiscard]] auto kind() const -> std::string_view override;
    [[nodiscard]] auto forcedLoading() const -> std::optional<bool> override { return false; }
    [[nodiscard]] auto generate(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;
    [[nodiscard]] auto generateTest(SceneState const& scene, RenderedFrame const& frame, Rng& rng) const
        -> Expected<std::vector<TrainingSample>> override;

private:
    auto emit(SceneState const& scene, RenderedFrame const& frame, bool testCases) const
        -> Expected<std::vector<TrainingSample>>;

    std::shared_ptr<const LayoutCatalog> catalog_;
    TaskOptions                          options_;
};

// Fills "[icon_list]" and "[icon_label]" in `templ`.
[[nodiscard]] auto renderListPrompt(std::string const& templ, std::vector<std::string> const& labels, std::string const& target)
    -> std::string;

// Reads the rendered "[icon_list]" portion of a prompt back into labels. Each
// entry is matched against `vocabulary` (longest label first), so labels that
// contain the separator still come back whole.
[[nodiscard]] auto parseListedLabels(std::string const& templ,
                                     std::string const& prompt,
                                     std::vector<std::string> const& vocabulary) -> Expected<std::vector<std::string>>;

} // namespace GS
