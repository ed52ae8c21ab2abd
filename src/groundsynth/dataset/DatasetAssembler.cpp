#include "dataset/DatasetAssembler.hpp"

#include "io/JsonFiles.hpp"
#include "log/TaggedLogger.hpp"
#include "render/ImageIo.hpp"
#include "scene/SceneSampler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <set>

namespace GS {
namespace {

namespace fs = std::filesystem;
using Json   = nlohmann::json;

constexpr char const* kConfigFile = "config.json";
constexpr char const* kDataFile   = "data.jsonl";
constexpr char const* kTrainFile  = "train.jsonl";
constexpr char const* kValFile    = "val.jsonl";
constexpr char const* kTestDir    = "test";
constexpr char const* kTestFile   = "test.jsonl";

auto ioError(std::string what, std::error_code const& ec) -> Error {
    return makeError(Error::Code::IoError, std::move(what) + ": " + ec.message());
}

// Removes the staging directory unless the run committed it.
class StagingDirectory {
public:
    explicit StagingDirectory(fs::path path)
        : path_(std::move(path)) {}
    ~StagingDirectory() {
        if (!committed_) {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec)
                gs_log("Could not remove staging directory " + path_.string() + ": " + ec.message(), "Assembler", "Error");
        }
    }

    StagingDirectory(StagingDirectory const&)                    = delete;
    auto operator=(StagingDirectory const&) -> StagingDirectory& = delete;

    [[nodiscard]] auto path() const -> fs::path const& { return path_; }

    auto prepare() -> Expected<void> {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec)
            return std::unexpected(ioError("cannot clear " + path_.string(), ec));
        fs::create_directories(path_, ec);
        if (ec)
            return std::unexpected(ioError("cannot create " + path_.string(), ec));
        return {};
    }

    // An existing target is only replaced when it is empty or an earlier dataset.
    auto commit(fs::path const& target) -> Expected<void> {
        std::error_code ec;
        if (fs::exists(target, ec)) {
            if (!replaceable(target)) {
                return std::unexpected(makeError(Error::Code::ConfigurationError,
                                                 target.string()
                                                     + " exists and is not a dataset directory; refusing to replace it"));
            }
            fs::remove_all(target, ec);
            if (ec)
                return std::unexpected(ioError("cannot replace " + target.string(), ec));
        }
        fs::rename(path_, target, ec);
        if (ec)
            return std::unexpected(ioError("cannot rename " + path_.string() + " to " + target.string(), ec));
        committed_ = true;
        return {};
    }

    [[nodiscard]] static auto replaceable(fs::path const& target) -> bool {
        std::error_code ec;
        if (!fs::is_directory(target, ec))
            return false;
        if (fs::is_empty(target, ec) && !ec)
            return true;
        return fs::is_regular_file(target / kConfigFile, ec) && fs::is_regular_file(target / kDataFile, ec);
    }

private:
    fs::path path_;
    bool     committed_ = false;
};

auto totalCount(std::map<std::string, int> const& counts) -> int {
    int total = 0;
    for (auto const& [_, count] : counts)
        total += count;
    return total;
}

auto imageName(std::string_view kind, std::uint64_t sceneIndex, SurfaceId const& surface) -> std::string {
    char index[24];
    std::snprintf(index, sizeof(index), "%05llu", static_cast<unsigned long long>(sceneIndex));
    std::string name(kind);
    name.push_back('_');
    name.append(index);
    if (surface != fullFrameSurfaceId()) {
        name.push_back('_');
        name.append(surface.str());
    }
    name.append(".png");
    return name;
}

auto recordsFor(std::vector<TrainingSample> const& samples, std::optional<Split> split) -> std::vector<Json> {
    std::vector<Json> records;
    for (auto const& sample : samples) {
        if (!split || sample.split() == *split)
            records.push_back(sample.toRecordJson());
    }
    return records;
}

auto loadRecords(fs::path const& root, fs::path const& file, std::vector<TrainingSample>& out) -> Expected<void> {
    auto records = readJsonLines(root / file);
    if (!records)
        return std::unexpected(records.error());
    for (std::size_t line = 0; line < records->size(); ++line) {
        auto sample = TrainingSample::fromRecordJson((*records)[line]);
        if (!sample) {
            auto error    = sample.error();
            error.message = file.generic_string() + ":" + std::to_string(line + 1) + ": " + error.message.value_or("");
            return std::unexpected(error);
        }
        if (!fs::exists(root / sample->image().relativePath)) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             "sample '" + sample->id() + "' references missing image "
                                                 + sample->image().relativePath));
        }
        out.push_back(std::move(*sample));
    }
    return {};
}

} // namespace

struct DatasetAssembler::SplitJob {
    Split                                     split = Split::Unassigned;
    std::map<std::string, int> const*         counts = nullptr;
    std::vector<std::chrono::sys_days> const* days   = nullptr;
    fs::path                                  imageDir;
};

auto Dataset::countSplit(Split split) const -> std::size_t {
    auto matches = [split](TrainingSample const& s) { return s.split() == split; };
    return static_cast<std::size_t>(std::count_if(samples.begin(), samples.end(), matches)
                                    + std::count_if(testSamples.begin(), testSamples.end(), matches));
}

auto planHeldOutDays(Rng&                  rng,
                     std::chrono::sys_days start,
                     std::chrono::sys_days end,
                     double                fraction,
                     bool                  reserveTest,
                     bool                  needTrainVal) -> Expected<HeldOutPlan> {
    if (end < start)
        return std::unexpected(makeError(Error::Code::ConfigurationError, "date range is inverted"));

    std::vector<std::chrono::sys_days> days;
    for (auto day = start; day <= end; day += std::chrono::days{1})
        days.push_back(day);

    std::size_t reserved = 0;
    if (reserveTest) {
        reserved = static_cast<std::size_t>(std::ceil(static_cast<double>(days.size()) * fraction - 1e-9));
        reserved = std::clamp<std::size_t>(reserved, 1, days.size());
    }
    if (needTrainVal && reserved >= days.size()) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "held-out fraction leaves no day of " + formatIsoDate(start) + " .. "
                                             + formatIsoDate(end) + " for train/val"));
    }
    rng.shuffle(days);

    HeldOutPlan plan;
    plan.testDays.assign(days.begin(), days.begin() + static_cast<std::ptrdiff_t>(reserved));
    plan.trainValDays.assign(days.begin() + static_cast<std::ptrdiff_t>(reserved), days.end());
    std::sort(plan.testDays.begin(), plan.testDays.end());
    std::sort(plan.trainValDays.begin(), plan.trainValDays.end());
    return plan;
}

DatasetAssembler::DatasetAssembler(DatasetConfig                        config,
                                   std::shared_ptr<const LayoutCatalog> catalog,
                                   SceneRenderer const&                 renderer,
                                   TaskRegistry const&                  registry)
    : config_(std::move(config)), catalog_(std::move(catalog)), renderer_(renderer), registry_(registry) {}

auto DatasetAssembler::assemble() -> Expected<Dataset> {
    if (!catalog_)
        return std::unexpected(makeError(Error::Code::InvalidArgument, "assembler needs a layout catalog"));
    if (auto valid = config_.validate(registry_); !valid)
        return std::unexpected(valid.error());
    if (config_.outputDir.empty())
        return std::unexpected(makeError(Error::Code::ConfigurationError, "no output directory configured"));

    auto output = config_.outputDir;
    if (!output.has_filename())
        output = output.parent_path();
    if (std::error_code ec; fs::exists(output, ec) && !StagingDirectory::replaceable(output)) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         output.string() + " exists and is not a dataset directory; refusing to replace it"));
    }
    StagingDirectory staging(fs::path(output.string() + ".partial"));
    if (auto prepared = staging.prepare(); !prepared)
        return std::unexpected(prepared.error());

    gs_log("Assembling '" + config_.name + "' into " + staging.path().string() + " with seed "
               + std::to_string(config_.seed),
           "Assembler");

    Rng  rng(config_.seed);
    auto plan = planHeldOutDays(rng,
                                config_.sampler.dateStart,
                                config_.sampler.dateEnd,
                                config_.heldOutFraction,
                                totalCount(config_.testCounts) > 0,
                                totalCount(config_.taskCounts) > 0);
    if (!plan)
        return std::unexpected(plan.error());
    gs_log(std::to_string(plan->testDays.size()) + " of "
               + std::to_string(plan->testDays.size() + plan->trainValDays.size()) + " days held out for test",
           "Assembler");

    std::uint64_t sceneIndex = 0;
    SplitJob      trainValJob{Split::Unassigned, &config_.taskCounts, &plan->trainValDays, fs::path("images")};
    SplitJob      testJob{Split::Test, &config_.testCounts, &plan->testDays, fs::path(kTestDir) / "images"};

    auto trainVal = generateSplit(rng, trainValJob, sceneIndex, staging.path());
    if (!trainVal)
        return std::unexpected(trainVal.error());
    auto test = generateSplit(rng, testJob, sceneIndex, staging.path());
    if (!test)
        return std::unexpected(test.error());

    rng.shuffle(*trainVal);
    auto trainCount =
        static_cast<std::size_t>(std::lround(static_cast<double>(trainVal->size()) * config_.trainRatio));
    for (std::size_t i = 0; i < trainVal->size(); ++i)
        (*trainVal)[i].setSplit(i < trainCount ? Split::Train : Split::Val);

    if (auto valid = validateSamples(*trainVal, staging.path()); !valid)
        return std::unexpected(valid.error());
    if (auto valid = validateSamples(*test, staging.path()); !valid)
        return std::unexpected(valid.error());

    Dataset dataset{config_, output, std::move(*trainVal), std::move(*test)};
    if (auto written = persist(dataset, staging.path()); !written)
        return std::unexpected(written.error());
    if (auto committed = staging.commit(output); !committed)
        return std::unexpected(committed.error());

    gs_log("Dataset written to " + output.string() + ": " + std::to_string(dataset.countSplit(Split::Train)) + " train, "
               + std::to_string(dataset.countSplit(Split::Val)) + " val, "
               + std::to_string(dataset.testSamples.size()) + " test",
           "Assembler");
    return dataset;
}

auto DatasetAssembler::generateSplit(Rng& rng, SplitJob const& job, std::uint64_t& sceneIndex, fs::path const& staging)
    -> Expected<std::vector<TrainingSample>> {
    SceneSampler                sampler;
    std::vector<TrainingSample> samples;

    // std::map iterates kinds in sorted order, which fixes the draw order of the run.
    for (auto const& [kind, count] : *job.counts) {
        auto const* generator = registry_.find(kind);
        if (generator == nullptr)
            return std::unexpected(makeError(Error::Code::ConfigurationError, "unknown task kind '" + kind + "'"));

        for (int n = 0; n < count; ++n) {
            auto context         = config_.samplerContext();
            context.allowedDays  = *job.days;
            context.forceLoading = generator->forcedLoading();
            context.sceneIndex   = sceneIndex++;

            auto scene = sampler.sample(rng, *catalog_, context);
            if (!scene)
                return std::unexpected(scene.error());
            auto frame = renderer_.render(*scene, *catalog_);
            if (!frame)
                return std::unexpected(frame.error());
            for (auto const& crop : renderer_.declaredCrops()) {
                if (auto surface = frame->surface(crop.id); !surface) {
                    return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                                     "renderer declared crop '" + crop.id.str()
                                                         + "' but did not return it"));
                }
            }

            auto generated = job.split == Split::Test ? generator->generateTest(*scene, *frame, rng)
                                                      : generator->generate(*scene, *frame, rng);
            if (!generated)
                return std::unexpected(generated.error());

            std::map<std::string, std::string> written; // surface id -> relative image path
            for (auto& sample : *generated) {
                auto const& surfaceId = sample.image().surface.id;
                auto        it        = written.find(surfaceId.str());
                if (it == written.end()) {
                    auto surface = frame->surface(surfaceId);
                    if (!surface)
                        return std::unexpected(surface.error());
                    if ((*surface)->ref != sample.image().surface) {
                        return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                                         "sample '" + sample.id() + "' declares a "
                                                             + std::to_string(sample.image().surface.width) + "x"
                                                             + std::to_string(sample.image().surface.height)
                                                             + " image but the surface was rendered at "
                                                             + std::to_string((*surface)->ref.width) + "x"
                                                             + std::to_string((*surface)->ref.height)));
                    }
                    auto relative = (job.imageDir / imageName(kind, context.sceneIndex, surfaceId)).generic_string();
                    if (auto png = WriteImagePng((*surface)->image, staging / relative); !png)
                        return std::unexpected(png.error());
                    it = written.emplace(surfaceId.str(), relative).first;
                }
                sample.setImagePath(it->second);
                if (job.split == Split::Test)
                    sample.setSplit(Split::Test);
                samples.push_back(std::move(sample));
            }
        }
        gs_log("Kind " + kind + ": " + std::to_string(count) + " scenes", "Assembler", "INFO");
    }
    return samples;
}

auto DatasetAssembler::validateSamples(std::vector<TrainingSample> const& samples, fs::path const& staging) const
    -> Expected<void> {
    std::set<std::string> ids;
    for (auto const& sample : samples) {
        if (auto valid = validateAction(sample.action(), sample.image().surface); !valid) {
            auto error    = valid.error();
            error.message = "sample '" + sample.id() + "': " + error.message.value_or("");
            return std::unexpected(error);
        }
        if (sample.image().relativePath.empty() || !fs::exists(staging / sample.image().relativePath)) {
            return std::unexpected(
                makeError(Error::Code::SchemaViolation, "sample '" + sample.id() + "' has no written image"));
        }
        if (sample.split() == Split::Unassigned) {
            return std::unexpected(
                makeError(Error::Code::SchemaViolation, "sample '" + sample.id() + "' was never assigned a split"));
        }
        if (!ids.insert(sample.id()).second) {
            return std::unexpected(makeError(Error::Code::SchemaViolation, "duplicate sample id '" + sample.id() + "'"));
        }
    }
    return {};
}

auto DatasetAssembler::persist(Dataset const& dataset, fs::path const& staging) const -> Expected<void> {
    auto runConfig = config_.toJson();
    // The output location is not part of what a run produces.
    runConfig.erase("output_dir");
    runConfig["layout"]  = config_.layout.filename().generic_string();
    runConfig["screen"]  = catalog_->screenName();
    runConfig["samples"] = {
        {"train", dataset.countSplit(Split::Train)},
        {"val", dataset.countSplit(Split::Val)},
        {"test", dataset.testSamples.size()},
    };

    Expected<void> steps[] = {
        writeJsonFile(staging / kConfigFile, runConfig),
        writeJsonLines(staging / kDataFile, recordsFor(dataset.samples, std::nullopt)),
        writeJsonLines(staging / kTrainFile, recordsFor(dataset.samples, Split::Train)),
        writeJsonLines(staging / kValFile, recordsFor(dataset.samples, Split::Val)),
        writeJsonLines(staging / kTestDir / kTestFile, recordsFor(dataset.testSamples, std::nullopt)),
    };
    for (auto const& step : steps) {
        if (!step)
            return step;
    }
    return {};
}

auto loadDataset(fs::path const& root) -> Expected<Dataset> {
    auto configJson = readJsonFile(root / kConfigFile);
    if (!configJson)
        return std::unexpected(configJson.error());
    auto config = DatasetConfig::fromJson(*configJson);
    if (!config)
        return std::unexpected(config.error());
    config->outputDir = root;

    Dataset dataset{*config, root, {}, {}};
    if (auto train = loadRecords(root, kTrainFile, dataset.samples); !train)
        return std::unexpected(train.error());
    if (auto val = loadRecords(root, kValFile, dataset.samples); !val)
        return std::unexpected(val.error());
    if (fs::exists(root / kTestDir / kTestFile)) {
        if (auto test = loadRecords(root, fs::path(kTestDir) / kTestFile, dataset.testSamples); !test)
            return std::unexpected(test.error());
    }
    gs_log("Loaded dataset " + root.string() + " with " + std::to_string(dataset.samples.size()) + " train/val and "
               + std::to_string(dataset.testSamples.size()) + " test samples",
           "Assembler");
    return dataset;
}

} // namespace GS
