#include "dataset/DatasetConfig.hpp"

#include "io/JsonFiles.hpp"
#include "log/TaggedLogger.hpp"
#include "task/TaskRegistry.hpp"

#include <algorithm>
#include <cmath>

namespace GS {
namespace {

using Json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return makeError(Error::Code::MalformedInput, std::move(message));
}

auto configuration(std::string message) -> Error {
    return makeError(Error::Code::ConfigurationError, std::move(message));
}

auto readNumber(Json const& node, char const* key, double& out) -> Expected<void> {
    auto it = node.find(key);
    if (it == node.end())
        return {};
    if (!it->is_number())
        return std::unexpected(malformed(std::string(key) + " must be a number"));
    out = it->get<double>();
    return {};
}

auto readInt(Json const& node, char const* key, int& out) -> Expected<void> {
    auto it = node.find(key);
    if (it == node.end())
        return {};
    auto value = jsonToInt(*it);
    if (!value)
        return std::unexpected(malformed(std::string(key) + " must be an integer in int range"));
    out = *value;
    return {};
}

auto readString(Json const& node, char const* key, std::string& out) -> Expected<void> {
    auto it = node.find(key);
    if (it == node.end())
        return {};
    if (!it->is_string())
        return std::unexpected(malformed(std::string(key) + " must be a string"));
    out = it->get<std::string>();
    return {};
}

auto readDate(Json const& node, char const* key, std::chrono::sys_days& out) -> Expected<void> {
    std::string text;
    if (auto read = readString(node, key, text); !read)
        return read;
    if (text.empty())
        return {};
    auto day = parseIsoDate(text);
    if (!day)
        return std::unexpected(day.error());
    out = *day;
    return {};
}

auto readCounts(Json const& node, char const* key, std::map<std::string, int>& out) -> Expected<void> {
    auto it = node.find(key);
    if (it == node.end())
        return {};
    if (!it->is_object())
        return std::unexpected(malformed(std::string(key) + " must map task kinds to scene counts"));
    out.clear();
    for (auto const& [kind, value] : it->items()) {
        auto count = jsonToInt(value);
        if (!count)
            return std::unexpected(malformed(std::string(key) + "." + kind + " must be an integer in int range"));
        out[kind] = *count;
    }
    return {};
}

auto countsToJson(std::map<std::string, int> const& counts) -> Json {
    Json node = Json::object();
    for (auto const& [kind, count] : counts)
        node[kind] = count;
    return node;
}

auto checkFraction(double value, char const* name, bool allowZero, bool allowOne) -> Expected<void> {
    bool ok = (allowZero ? value >= 0.0 : value > 0.0) && (allowOne ? value <= 1.0 : value < 1.0);
    if (!ok)
        return std::unexpected(configuration(std::string(name) + " out of range: " + std::to_string(value)));
    return {};
}

} // namespace

auto placementModeToString(PlacementMode mode) -> std::string_view {
    return mode == PlacementMode::Flow ? "flow" : "authored";
}

auto parsePlacementMode(std::string_view text) -> std::optional<PlacementMode> {
    if (text == "authored")
        return PlacementMode::Authored;
    if (text == "flow")
        return PlacementMode::Flow;
    return std::nullopt;
}

auto DatasetConfig::fromJson(Json const& document) -> Expected<DatasetConfig> {
    if (!document.is_object())
        return std::unexpected(malformed("dataset config must be a JSON object"));

    DatasetConfig config;
    std::string   layout;
    std::string   output;

    Expected<void> steps[] = {
        readString(document, "name", config.name),
        readString(document, "version", config.version),
        readString(document, "layout", layout),
        readString(document, "output_dir", output),
        readCounts(document, "task_counts", config.taskCounts),
        readCounts(document, "test_counts", config.testCounts),
        readNumber(document, "train_ratio", config.trainRatio),
        readNumber(document, "held_out_fraction", config.heldOutFraction),
        readNumber(document, "tolerance_scale", config.tasks.toleranceScale),
    };
    for (auto const& step : steps) {
        if (!step)
            return std::unexpected(step.error());
    }
    config.layout    = layout;
    config.outputDir = output;

    if (auto seed = document.find("seed"); seed != document.end()) {
        bool negative = seed->is_number_integer() && !seed->is_number_unsigned() && seed->get<std::int64_t>() < 0;
        if (!seed->is_number_integer() || negative)
            return std::unexpected(malformed("seed must be a non-negative integer"));
        config.seed = seed->get<std::uint64_t>();
    }

    if (auto sampler = document.find("sampler"); sampler != document.end()) {
        if (!sampler->is_object())
            return std::unexpected(malformed("sampler must be an object"));
        auto&          s = config.sampler;
        std::string    placement{placementModeToString(s.placement)};
        Expected<void> samplerSteps[] = {
            readNumber(*sampler, "desktop_min_frac", s.desktopMinFrac),
            readNumber(*sampler, "taskbar_min_frac", s.taskbarMinFrac),
            readNumber(*sampler, "loading_probability", s.loadingProbability),
            readDate(*sampler, "date_start", s.dateStart),
            readDate(*sampler, "date_end", s.dateEnd),
            readString(*sampler, "placement", placement),
        };
        for (auto const& step : samplerSteps) {
            if (!step)
                return std::unexpected(step.error());
        }
        auto mode = parsePlacementMode(placement);
        if (!mode)
            return std::unexpected(configuration("unknown placement mode '" + placement + "'"));
        s.placement = *mode;
    }

    if (auto wait = document.find("wait"); wait != document.end()) {
        if (!wait->is_object())
            return std::unexpected(malformed("wait must be an object"));
        std::string    target{waitTargetModeToString(config.tasks.waitTarget)};
        Expected<void> waitSteps[] = {
            readString(*wait, "target", target),
            readInt(*wait, "min_seconds", config.tasks.waitMinSeconds),
            readInt(*wait, "max_seconds", config.tasks.waitMaxSeconds),
        };
        for (auto const& step : waitSteps) {
            if (!step)
                return std::unexpected(step.error());
        }
        auto mode = parseWaitTargetMode(target);
        if (!mode)
            return std::unexpected(configuration("unknown wait target '" + target + "'"));
        config.tasks.waitTarget = *mode;
    }

    if (auto cases = document.find("test_cases"); cases != document.end()) {
        if (!cases->is_object())
            return std::unexpected(malformed("test_cases must be an object"));
        Expected<void> caseSteps[] = {
            readInt(*cases, "desktop_tolerance_px", config.tasks.desktopTestTolerancePixels),
            readInt(*cases, "taskbar_tolerance_px", config.tasks.taskbarTestTolerancePixels),
            readInt(*cases, "wait_seconds", config.tasks.testWaitSeconds),
        };
        for (auto const& step : caseSteps) {
            if (!step)
                return std::unexpected(step.error());
        }
    }

    if (auto valid = config.validate(); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto DatasetConfig::toJson() const -> Json {
    return Json{
        {"name", name},
        {"version", version},
        {"seed", seed},
        {"layout", layout.generic_string()},
        {"output_dir", outputDir.generic_string()},
        {"task_counts", countsToJson(taskCounts)},
        {"test_counts", countsToJson(testCounts)},
        {"train_ratio", trainRatio},
        {"held_out_fraction", heldOutFraction},
        {"tolerance_scale", tasks.toleranceScale},
        {"sampler",
         {
             {"desktop_min_frac", sampler.desktopMinFrac},
             {"taskbar_min_frac", sampler.taskbarMinFrac},
             {"loading_probability", sampler.loadingProbability},
             {"date_start", formatIsoDate(sampler.dateStart)},
             {"date_end", formatIsoDate(sampler.dateEnd)},
             {"placement", std::string(placementModeToString(sampler.placement))},
         }},
        {"wait",
         {
             {"target", std::string(waitTargetModeToString(tasks.waitTarget))},
             {"min_seconds", tasks.waitMinSeconds},
             {"max_seconds", tasks.waitMaxSeconds},
         }},
        {"test_cases",
         {
             {"desktop_tolerance_px", tasks.desktopTestTolerancePixels},
             {"taskbar_tolerance_px", tasks.taskbarTestTolerancePixels},
             {"wait_seconds", tasks.testWaitSeconds},
         }},
    };
}

auto DatasetConfig::validate() const -> Expected<void> {
    Expected<void> checks[] = {
        checkFraction(trainRatio, "train_ratio", false, true),
        checkFraction(heldOutFraction, "held_out_fraction", true, false),
        checkFraction(sampler.desktopMinFrac, "sampler.desktop_min_frac", true, true),
        checkFraction(sampler.taskbarMinFrac, "sampler.taskbar_min_frac", true, true),
        checkFraction(sampler.loadingProbability, "sampler.loading_probability", true, true),
    };
    for (auto const& check : checks) {
        if (!check)
            return check;
    }
    if (sampler.dateEnd < sampler.dateStart) {
        return std::unexpected(configuration("date range " + formatIsoDate(sampler.dateStart) + " .. "
                                             + formatIsoDate(sampler.dateEnd) + " is inverted"));
    }
    if (!(tasks.toleranceScale > 0.0))
        return std::unexpected(configuration("tolerance_scale must be positive"));
    if (tasks.waitMinSeconds < 1 || tasks.waitMaxSeconds < tasks.waitMinSeconds) {
        return std::unexpected(configuration("wait seconds must satisfy 1 <= min_seconds <= max_seconds"));
    }
    if (tasks.desktopTestTolerancePixels < 1 || tasks.taskbarTestTolerancePixels < 1 || tasks.testWaitSeconds < 1)
        return std::unexpected(configuration("test_cases values must be at least 1"));
    int total = 0;
    for (auto const* counts : {&taskCounts, &testCounts}) {
        for (auto const& [kind, count] : *counts) {
            if (count < 0)
                return std::unexpected(configuration("count for '" + kind + "' is negative"));
            total += count;
        }
    }
    if (total == 0)
        return std::unexpected(configuration("config requests no scenes"));
    return {};
}

auto DatasetConfig::validate(TaskRegistry const& registry) const -> Expected<void> {
    if (auto valid = validate(); !valid)
        return valid;
    for (auto const* counts : {&taskCounts, &testCounts}) {
        for (auto const& [kind, count] : *counts) {
            if (!registry.contains(kind))
                return std::unexpected(configuration("unknown task kind '" + kind + "'"));
        }
    }
    return {};
}

auto DatasetConfig::scaled(double factor) const -> DatasetConfig {
    DatasetConfig copy = *this;
    for (auto* counts : {&copy.taskCounts, &copy.testCounts}) {
        for (auto& [kind, count] : *counts) {
            if (count > 0)
                count = std::max(1, static_cast<int>(std::lround(count * factor)));
        }
    }
    return copy;
}

auto DatasetConfig::samplerContext() const -> SamplerContext {
    SamplerContext context;
    context.desktopMinFrac     = sampler.desktopMinFrac;
    context.taskbarMinFrac     = sampler.taskbarMinFrac;
    context.loadingProbability = sampler.loadingProbability;
    context.dateStart          = sampler.dateStart;
    context.dateEnd            = sampler.dateEnd;
    context.placement          = sampler.placement;
    return context;
}

auto loadDatasetConfig(std::filesystem::path const& path) -> Expected<DatasetConfig> {
    auto json = readJsonFile(path);
    if (!json)
        return std::unexpected(json.error());
    auto config = DatasetConfig::fromJson(*json);
    if (!config)
        return config;

    auto base = path.parent_path();
    if (!config->layout.empty() && config->layout.is_relative())
        config->layout = base / config->layout;
    if (!config->outputDir.empty() && config->outputDir.is_relative())
        config->outputDir = base / config->outputDir;
    gs_log("Loaded dataset config " + path.string() + " (seed " + std::to_string(config->seed) + ")", "Assembler");
    return config;
}

} // namespace GS
