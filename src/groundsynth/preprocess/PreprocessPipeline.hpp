#pragma once

#include "core/Error.hpp"
#include "sample/TrainingSample.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace GS {

struct PreprocessInput {
    std::size_t           index = 0;
    TrainingSample        sample;
    std::filesystem::path sourceImage;    // absolute
    std::filesystem::path outputImage;    // absolute
    std::string           relativeOutput; // as recorded in the manifest
};

struct ManifestEntry {
    std::size_t index = 0;
    std::string sampleId;
    std::string taskType;
    Split       split = Split::Unassigned;
    std::string originalImage;
    std::string preprocessedFile;
};

struct Manifest {
    std::vector<ManifestEntry> entries; // in input order
    std::size_t                trainSamples = 0;
    std::size_t                valSamples   = 0;
    std::size_t                testSamples  = 0;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

struct FailedSample {
    std::size_t index = 0;
    Error       error;
};

struct PipelineFailure {
    std::vector<FailedSample> failures; // sorted by index
    std::optional<Error>      fatal;    // set when the pass could not start or finish

    [[nodiscard]] auto indices() const -> std::vector<std::size_t>;
    [[nodiscard]] auto describe() const -> std::string;
};

using PreprocessTransform = std::function<Expected<ManifestEntry>(PreprocessInput const&)>;
using PipelineResult      = std::expected<Manifest, PipelineFailure>;

/**
 * Runs a pure per-sample transform on a TaskPool.
 *
 * Results are joined by input index after the pool drained, so the manifest
 * order never depends on scheduling. Any failed entry, including a transform
 * that threw, turns the whole pass into a PipelineFailure.
 */
class PreprocessPipeline {
public:
    [[nodiscard]] static auto run(std::vector<PreprocessInput> const& inputs,
                                  PreprocessTransform const&          transform,
                                  std::size_t                         workerCount) -> PipelineResult;
};

// Decodes the sample image, checks it against the declared surface and writes it again as PNG.
class ReencodeTransform {
public:
    auto operator()(PreprocessInput const& input) const -> Expected<ManifestEntry>;
};

inline constexpr char const* kPreprocessedDir = "preprocessed";

// Preprocesses a persisted dataset into <root>/preprocessed; metadata.json is written only on success.
[[nodiscard]] auto preprocessDatasetAt(std::filesystem::path const& root,
                                       std::size_t                  workerCount,
                                       PreprocessTransform const&   transform = ReencodeTransform{}) -> PipelineResult;

} // namespace GS
