#include "verify/LeakageVerifier.hpp"

#include "dataset/DatasetAssembler.hpp"
#include "io/JsonFiles.hpp"
#include "log/TaggedLogger.hpp"

#include <map>

namespace GS {
namespace {

namespace fs = std::filesystem;

auto keysOf(fs::path const& file) -> Expected<std::vector<std::string>> {
    auto records = readJsonLines(file);
    if (!records)
        return std::unexpected(records.error());
    std::vector<std::string> keys;
    keys.reserve(records->size());
    for (std::size_t line = 0; line < records->size(); ++line) {
        auto const& record = (*records)[line];
        auto        key    = record.is_object() ? record.find("key") : record.end();
        if (!record.is_object() || key == record.end() || !key->is_string() || key->get<std::string>().empty()) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             file.string() + ":" + std::to_string(line + 1)
                                                 + " has no disjointness key"));
        }
        keys.push_back(key->get<std::string>());
    }
    return keys;
}

auto appendKeys(fs::path const& file, std::vector<std::string>& out) -> Expected<void> {
    auto keys = keysOf(file);
    if (!keys)
        return std::unexpected(keys.error());
    out.insert(out.end(), keys->begin(), keys->end());
    return {};
}

} // namespace

auto LeakageReport::toJson() const -> nlohmann::json {
    auto list = nlohmann::json::array();
    for (auto const& violation : violations) {
        list.push_back({{"key", violation.key},
                        {"train_val_samples", violation.trainValSamples},
                        {"test_samples", violation.testSamples}});
    }
    return nlohmann::json{
        {"ok", ok},
        {"violations", std::move(list)},
        {"train_val_keys", trainValKeys},
        {"test_keys", testKeys},
        {"train_val_samples", trainValSamples},
        {"test_samples", testSamples},
    };
}

auto verifyKeys(std::vector<std::string> const& trainValKeys, std::vector<std::string> const& testKeys) -> LeakageReport {
    std::map<std::string, std::size_t> trainVal;
    std::map<std::string, std::size_t> test;
    for (auto const& key : trainValKeys)
        ++trainVal[key];
    for (auto const& key : testKeys)
        ++test[key];

    LeakageReport report;
    report.trainValKeys    = trainVal.size();
    report.testKeys        = test.size();
    report.trainValSamples = trainValKeys.size();
    report.testSamples     = testKeys.size();
    for (auto const& [key, count] : test) {
        if (auto it = trainVal.find(key); it != trainVal.end())
            report.violations.push_back(LeakageViolation{key, it->second, count});
    }
    report.ok = report.violations.empty();
    gs_log("Leakage check: " + std::to_string(report.trainValKeys) + " train/val keys, " + std::to_string(report.testKeys)
               + " test keys, " + std::to_string(report.violations.size()) + " shared",
           "Verifier");
    return report;
}

auto verify(Dataset const& dataset) -> LeakageReport {
    std::vector<std::string> trainVal;
    std::vector<std::string> test;
    trainVal.reserve(dataset.samples.size());
    test.reserve(dataset.testSamples.size());
    for (auto const& sample : dataset.samples)
        trainVal.push_back(sample.disjointnessKey());
    for (auto const& sample : dataset.testSamples)
        test.push_back(sample.disjointnessKey());
    return verifyKeys(trainVal, test);
}

auto verifyDatasetAt(fs::path const& root) -> Expected<LeakageReport> {
    if (!fs::is_directory(root))
        return std::unexpected(makeError(Error::Code::NotFound, "no dataset directory at " + root.string()));

    std::vector<std::string> trainVal;
    if (fs::exists(root / "data.jsonl")) {
        if (auto read = appendKeys(root / "data.jsonl", trainVal); !read)
            return std::unexpected(read.error());
    } else {
        for (auto const* file : {"train.jsonl", "val.jsonl"}) {
            if (auto read = appendKeys(root / file, trainVal); !read)
                return std::unexpected(read.error());
        }
    }

    std::vector<std::string> test;
    auto                     testFile = root / "test" / "test.jsonl";
    if (fs::exists(testFile)) {
        if (auto read = appendKeys(testFile, test); !read)
            return std::unexpected(read.error());
    } else {
        gs_log("No test split under " + root.string(), "Verifier", "Warning");
    }
    return verifyKeys(trainVal, test);
}

auto writeReport(LeakageReport const& report, fs::path const& path) -> Expected<void> {
    return writeJsonFile(path, report.toJson());
}

auto requireNoLeakage(LeakageReport const& report) -> Expected<void> {
    if (report.ok)
        return {};
    std::string keys;
    for (auto const& violation : report.violations) {
        if (!keys.empty())
            keys.append(", ");
        keys.append(violation.key);
    }
    return std::unexpected(makeError(Error::Code::Leakage,
                                     std::to_string(report.violations.size())
                                         + " disjointness keys appear in both train/val and test: " + keys));
}

} // namespace GS
