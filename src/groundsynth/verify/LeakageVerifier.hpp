#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace GS {

struct Dataset;

struct LeakageViolation {
    std::string key;
    std::size_t trainValSamples = 0;
    std::size_t testSamples     = 0;
};

struct LeakageReport {
    bool                          ok = true;
    std::vector<LeakageViolation> violations; // sorted by key
    std::size_t                   trainValKeys    = 0;
    std::size_t                   testKeys        = 0;
    std::size_t                   trainValSamples = 0;
    std::size_t                   testSamples     = 0;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

inline constexpr char const* kVerifyReportFile = "verify_report.json";

/**
 * Disjointness check between the train/val pool and the test split.
 *
 * Only reads; running it twice on the same data gives the same report. The
 * on-disk variant needs nothing but the persisted record format: the "key"
 * field of data.jsonl (or train.jsonl plus val.jsonl) and test/test.jsonl.
 */
[[nodiscard]] auto verify(Dataset const& dataset) -> LeakageReport;
[[nodiscard]] auto verifyKeys(std::vector<std::string> const& trainValKeys, std::vector<std::string> const& testKeys)
    -> LeakageReport;
[[nodiscard]] auto verifyDatasetAt(std::filesystem::path const& root) -> Expected<LeakageReport>;

auto writeReport(LeakageReport const& report, std::filesystem::path const& path) -> Expected<void>;

// Turns a failing report into an Error::Code::Leakage error.
[[nodiscard]] auto requireNoLeakage(LeakageReport const& report) -> Expected<void>;

} // namespace GS
