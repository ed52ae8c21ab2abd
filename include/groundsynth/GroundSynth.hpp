#pragma once

#include "core/Error.hpp"
#include "dataset/DatasetAssembler.hpp"
#include "dataset/DatasetConfig.hpp"
#include "preprocess/PreprocessPipeline.hpp"
#include "verify/LeakageVerifier.hpp"

#include <cstddef>
#include <filesystem>

namespace GS {

/**
 * Generates and persists a dataset.
 *
 * Loads the layout named by the config, renders with the schematic renderer
 * and generates with the built-in task registry.
 */
[[nodiscard]] auto generate(DatasetConfig const& config) -> Expected<Dataset>;

// Leakage check of a persisted dataset.
[[nodiscard]] auto verify(std::filesystem::path const& datasetRoot) -> Expected<LeakageReport>;

[[nodiscard]] auto preprocess(std::filesystem::path const& datasetRoot, std::size_t workers) -> PipelineResult;

} // namespace GS
