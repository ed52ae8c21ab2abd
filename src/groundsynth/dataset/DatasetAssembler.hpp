#pragma once

#include "core/Error.hpp"
#include "dataset/DatasetConfig.hpp"
#include "layout/LayoutCatalog.hpp"
#include "render/SceneRenderer.hpp"
#include "sample/TrainingSample.hpp"
#include "scene/Rng.hpp"
#include "task/TaskRegistry.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

namespace GS {

struct Dataset {
    DatasetConfig               config;
    std::filesystem::path       root;
    std::vector<TrainingSample> samples; // train records first, then val
    std::vector<TrainingSample> testSamples;

    [[nodiscard]] auto countSplit(Split split) const -> std::size_t;
};

// Days of the configured range split into train/val-only and test-only days.
struct HeldOutPlan {
    std::vector<std::chrono::sys_days> trainValDays;
    std::vector<std::chrono::sys_days> testDays;
};

/**
 * Draws the held-out plan from `rng`.
 *
 * The whole range is shuffled and the first ceil(days * fraction) days (at
 * least one when `reserveTest` is set) are kept for test. Both lists come back
 * sorted. Fails when train/val scenes are wanted but no day is left for them.
 */
[[nodiscard]] auto planHeldOutDays(Rng&                  rng,
                                   std::chrono::sys_days start,
                                   std::chrono::sys_days end,
                                   double                fraction,
                                   bool                  reserveTest,
                                   bool                  needTrainVal) -> Expected<HeldOutPlan>;

/**
 * Drives sampler, renderer and generators for a whole run and persists the
 * result.
 *
 * Everything is written under "<output>.partial" first; the directory is
 * renamed to the output path only once every sample validated and every file
 * was written, and removed on any failure.
 */
class DatasetAssembler {
public:
    DatasetAssembler(DatasetConfig                        config,
                     std::shared_ptr<const LayoutCatalog> catalog,
                     SceneRenderer const&                 renderer,
                     TaskRegistry const&                  registry);

    [[nodiscard]] auto assemble() -> Expected<Dataset>;

private:
    struct SplitJob;

    auto generateSplit(Rng& rng, SplitJob const& job, std::uint64_t& sceneIndex, std::filesystem::path const& staging)
        -> Expected<std::vector<TrainingSample>>;
    auto validateSamples(std::vector<TrainingSample> const& samples, std::filesystem::path const& staging) const
        -> Expected<void>;
    auto persist(Dataset const& dataset, std::filesystem::path const& staging) const -> Expected<void>;

    DatasetConfig                        config_;
    std::shared_ptr<const LayoutCatalog> catalog_;
    SceneRenderer const&                 renderer_;
    TaskRegistry const&                  registry_;
};

// Re-reads a persisted dataset; records without tolerance or image are schema violations.
[[nodiscard]] auto loadDataset(std::filesystem::path const& root) -> Expected<Dataset>;

} // namespace GS
