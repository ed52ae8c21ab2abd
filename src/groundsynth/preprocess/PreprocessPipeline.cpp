#include "preprocess/PreprocessPipeline.hpp"

#include "dataset/DatasetAssembler.hpp"
#include "io/JsonFiles.hpp"
#include "log/TaggedLogger.hpp"
#include "preprocess/TaskPool.hpp"
#include "render/ImageIo.hpp"

#include <algorithm>
#include <exception>

namespace GS {
namespace {

namespace fs = std::filesystem;

auto fatalFailure(Error error) -> PipelineFailure {
    PipelineFailure failure;
    failure.fatal = std::move(error);
    return failure;
}

auto countEntries(Manifest& manifest) -> void {
    manifest.trainSamples = manifest.valSamples = manifest.testSamples = 0;
    for (auto const& entry : manifest.entries) {
        switch (entry.split) {
        case Split::Train:
            ++manifest.trainSamples;
            break;
        case Split::Val:
            ++manifest.valSamples;
            break;
        case Split::Test:
            ++manifest.testSamples;
            break;
        case Split::Unassigned:
            break;
        }
    }
}

} // namespace

auto Manifest::toJson() const -> nlohmann::json {
    auto list = nlohmann::json::array();
    for (auto const& entry : entries) {
        list.push_back({{"sample_id", entry.sampleId},
                        {"task_type", entry.taskType},
                        {"split", std::string(splitToString(entry.split))},
                        {"original_image", entry.originalImage},
                        {"preprocessed_file", entry.preprocessedFile}});
    }
    return nlohmann::json{
        {"train_samples", trainSamples},
        {"val_samples", valSamples},
        {"test_samples", testSamples},
        {"entries", std::move(list)},
    };
}

auto PipelineFailure::indices() const -> std::vector<std::size_t> {
    std::vector<std::size_t> result;
    result.reserve(failures.size());
    for (auto const& failure : failures)
        result.push_back(failure.index);
    return result;
}

auto PipelineFailure::describe() const -> std::string {
    std::string text;
    if (fatal)
        text = describeError(*fatal);
    for (auto const& failure : failures) {
        if (!text.empty())
            text.push_back('\n');
        text.append("sample " + std::to_string(failure.index) + ": " + describeError(failure.error));
    }
    return text;
}

auto PreprocessPipeline::run(std::vector<PreprocessInput> const& inputs,
                             PreprocessTransform const&          transform,
                             std::size_t                         workerCount) -> PipelineResult {
    if (!transform)
        return std::unexpected(fatalFailure(makeError(Error::Code::InvalidArgument, "no preprocessing transform")));

    std::vector<std::optional<Expected<ManifestEntry>>> results(inputs.size());
    {
        TaskPool pool(std::max<std::size_t>(1, workerCount));
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            auto submitted = pool.submit([&inputs, &transform, &results, i] {
                // Each job owns exactly one result slot.
                try {
                    results[i] = transform(inputs[i]);
                } catch (std::exception const& error) {
                    results[i] = std::unexpected(makeError(Error::Code::WorkerFailure, error.what()));
                } catch (...) {
                    results[i] = std::unexpected(makeError(Error::Code::WorkerFailure, "transform threw a non-standard exception"));
                }
            });
            if (submitted) {
                pool.waitIdle();
                return std::unexpected(fatalFailure(*submitted));
            }
        }
        pool.waitIdle();
        pool.shutdown();
    }

    Manifest        manifest;
    PipelineFailure failure;
    for (std::size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        if (!result) {
            failure.failures.push_back(
                FailedSample{inputs[i].index, makeError(Error::Code::WorkerFailure, "transform never ran")});
        } else if (!*result) {
            failure.failures.push_back(FailedSample{inputs[i].index, result->error()});
        } else {
            manifest.entries.push_back(std::move(**result));
        }
    }
    if (!failure.failures.empty()) {
        std::sort(failure.failures.begin(), failure.failures.end(),
                  [](FailedSample const& a, FailedSample const& b) { return a.index < b.index; });
        gs_log("Preprocessing failed for " + std::to_string(failure.failures.size()) + " of "
                   + std::to_string(inputs.size()) + " samples",
               "Preprocess", "Error");
        return std::unexpected(std::move(failure));
    }
    countEntries(manifest);
    gs_log("Preprocessed " + std::to_string(manifest.entries.size()) + " samples on " + std::to_string(workerCount)
               + " workers",
           "Preprocess");
    return manifest;
}

auto ReencodeTransform::operator()(PreprocessInput const& input) const -> Expected<ManifestEntry> {
    auto const& sample = input.sample;
    auto        image  = ReadImagePng(input.sourceImage);
    if (!image)
        return std::unexpected(image.error());

    auto const& surface = sample.image().surface;
    if (image->width != surface.width || image->height != surface.height) {
        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                         "sample '" + sample.id() + "' image is " + std::to_string(image->width) + "x"
                                             + std::to_string(image->height) + " but declares "
                                             + std::to_string(surface.width) + "x" + std::to_string(surface.height)));
    }
    if (auto valid = validateAction(sample.action(), surface); !valid)
        return std::unexpected(valid.error());

    if (auto written = WriteImagePng(*image, input.outputImage); !written)
        return std::unexpected(written.error());

    return ManifestEntry{input.index, sample.id(), sample.taskKind(), sample.split(), sample.image().relativePath,
                         input.relativeOutput};
}

auto preprocessDatasetAt(fs::path const& root, std::size_t workerCount, PreprocessTransform const& transform)
    -> PipelineResult {
    auto dataset = loadDataset(root);
    if (!dataset)
        return std::unexpected(fatalFailure(dataset.error()));

    auto const      outputDir = root / kPreprocessedDir;
    std::error_code ec;
    fs::remove_all(outputDir, ec);
    if (ec)
        return std::unexpected(fatalFailure(makeError(Error::Code::IoError, "cannot clear " + outputDir.string())));

    std::vector<PreprocessInput> inputs;
    std::size_t                  perSplit[4] = {0, 0, 0, 0};
    auto add = [&](TrainingSample const& sample) -> Expected<void> {
        auto splitName = std::string(splitToString(sample.split()));
        auto ordinal   = perSplit[static_cast<int>(sample.split())]++;
        auto relative  = std::string(kPreprocessedDir) + "/" + splitName + "/sample_" + std::to_string(ordinal) + ".png";
        fs::create_directories(outputDir / splitName, ec);
        if (ec)
            return std::unexpected(makeError(Error::Code::IoError, "cannot create " + (outputDir / splitName).string()));
        inputs.push_back(PreprocessInput{inputs.size(), sample, root / sample.image().relativePath, root / relative, relative});
        return {};
    };
    for (auto const* samples : {&dataset->samples, &dataset->testSamples}) {
        for (auto const& sample : *samples) {
            if (auto added = add(sample); !added) {
                fs::remove_all(outputDir, ec);
                return std::unexpected(fatalFailure(added.error()));
            }
        }
    }

    auto result = PreprocessPipeline::run(inputs, transform, workerCount);
    if (!result) {
        fs::remove_all(outputDir, ec);
        return result;
    }
    if (auto written = writeJsonFile(outputDir / "metadata.json", result->toJson()); !written) {
        fs::remove_all(outputDir, ec);
        return std::unexpected(fatalFailure(written.error()));
    }
    return result;
}

} // namespace GS
