#pragma once

#include "core/Error.hpp"
#include "scene/SceneSampler.hpp"
#include "task/TaskGenerator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace GS {

class TaskRegistry;

[[nodiscard]] auto placementModeToString(PlacementMode mode) -> std::string_view;
[[nodiscard]] auto parsePlacementMode(std::string_view text) -> std::optional<PlacementMode>;

struct SamplerSettings {
    double                desktopMinFrac     = 0.6;
    double                taskbarMinFrac     = 0.4;
    double                loadingProbability = 0.5;
    std::chrono::sys_days dateStart{std::chrono::year{2024} / 1 / 1};
    std::chrono::sys_days dateEnd{std::chrono::year{2025} / 12 / 31};
    PlacementMode         placement = PlacementMode::Authored;
};

/**
 * Everything a generation run depends on.
 *
 * Two runs with equal configs (seed included) produce byte-identical datasets.
 * Relative `layout` and `outputDir` paths are resolved against the directory of
 * the config file by loadDatasetConfig.
 */
struct DatasetConfig {
    std::string                name    = "groundsynth";
    std::string                version = "1.0.0";
    std::uint64_t              seed    = 42;
    std::filesystem::path      layout;
    std::filesystem::path      outputDir;
    std::map<std::string, int> taskCounts; // scenes per kind for train/val
    std::map<std::string, int> testCounts; // scenes per kind for the held-out test split
    double                     trainRatio      = 0.8;
    double                     heldOutFraction = 0.1;
    SamplerSettings            sampler;
    TaskOptions                tasks;

    [[nodiscard]] static auto fromJson(nlohmann::json const& document) -> Expected<DatasetConfig>;
    [[nodiscard]] auto        toJson() const -> nlohmann::json;

    // Value checks plus: every counted kind must be registered.
    [[nodiscard]] auto validate(TaskRegistry const& registry) const -> Expected<void>;
    [[nodiscard]] auto validate() const -> Expected<void>;

    // Multiplies every count by `factor`, keeping at least one scene per listed kind.
    [[nodiscard]] auto scaled(double factor) const -> DatasetConfig;

    [[nodiscard]] auto samplerContext() const -> SamplerContext;
};

[[nodiscard]] auto loadDatasetConfig(std::filesystem::path const& path) -> Expected<DatasetConfig>;

} // namespace GS
