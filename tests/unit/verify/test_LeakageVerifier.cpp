#include <doctest/doctest.h>
#include "../GroundSynthTestHelper.hpp"
#include "groundsynth/GroundSynth.hpp"
#include "io/JsonFiles.hpp"

using namespace GS;
namespace fs = std::filesystem;

TEST_SUITE("verify.leakage") {

TEST_CASE("disjoint key sets pass") {
    auto report = verifyKeys({"2024-03-01", "2024-03-02", "2024-03-01"}, {"2024-03-05"});
    CHECK(report.ok);
    CHECK(report.violations.empty());
    CHECK(report.trainValKeys == 2);
    CHECK(report.trainValSamples == 3);
    CHECK(report.testKeys == 1);
    CHECK(report.testSamples == 1);
    CHECK(requireNoLeakage(report).has_value());
}

TEST_CASE("shared keys are reported sorted with their sample counts") {
    auto report = verifyKeys({"2024-03-09", "2024-03-02", "2024-03-09", "2024-03-04"},
                             {"2024-03-09", "2024-03-02", "2024-03-07"});
    CHECK_FALSE(report.ok);
    REQUIRE(report.violations.size() == 2);
    CHECK(report.violations[0].key == "2024-03-02");
    CHECK(report.violations[0].trainValSamples == 1);
    CHECK(report.violations[0].testSamples == 1);
    CHECK(report.violations[1].key == "2024-03-09");
    CHECK(report.violations[1].trainValSamples == 2);

    auto json = report.toJson();
    CHECK(json["ok"] == false);
    CHECK(json["violations"].size() == 2);
    CHECK(json["violations"][1]["train_val_samples"] == 2);

    auto error = requireNoLeakage(report);
    REQUIRE_FALSE(error.has_value());
    CHECK(error.error().code == Error::Code::Leakage);
    CHECK(error.error().message->find("2024-03-02, 2024-03-09") != std::string::npos);
}

TEST_CASE("an empty test split never leaks") {
    auto report = verifyKeys({"2024-03-01"}, {});
    CHECK(report.ok);
    CHECK(report.testKeys == 0);
}

TEST_CASE("on-disk check of a generated dataset") {
    Test::TempDir dir("verify");
    auto          config  = Test::smallConfig(dir.path());
    auto          dataset = generate(config);
    REQUIRE(dataset.has_value());
    auto const root = config.outputDir;

    auto report = verifyDatasetAt(root);
    REQUIRE(report.has_value());
    CHECK(report->ok);
    CHECK(report->trainValSamples == dataset->samples.size());
    CHECK(report->testSamples == dataset->testSamples.size());
    CHECK(report->toJson() == verify(*dataset).toJson());

    SUBCASE("verification only reads") {
        auto before = Test::readText(root / "data.jsonl");
        auto again  = verifyDatasetAt(root);
        REQUIRE(again.has_value());
        CHECK(again->toJson() == report->toJson());
        CHECK(Test::readText(root / "data.jsonl") == before);
    }

    SUBCASE("a test record moved onto a train/val day is caught") {
        auto trainVal = readJsonLines(root / "data.jsonl");
        auto test     = readJsonLines(root / "test" / "test.jsonl");
        REQUIRE(trainVal.has_value());
        REQUIRE(test.has_value());
        auto leakedKey         = (*trainVal)[0]["key"].get<std::string>();
        (*test)[0]["key"]      = leakedKey;
        REQUIRE(writeJsonLines(root / "test" / "test.jsonl", *test).has_value());

        auto leaked = verifyDatasetAt(root);
        REQUIRE(leaked.has_value());
        CHECK_FALSE(leaked->ok);
        REQUIRE(leaked->violations.size() == 1);
        CHECK(leaked->violations[0].key == leakedKey);
        CHECK(requireNoLeakage(*leaked).error().code == Error::Code::Leakage);
    }

    SUBCASE("train and val files are used when data.jsonl is absent") {
        fs::remove(root / "data.jsonl");
        auto split = verifyDatasetAt(root);
        REQUIRE(split.has_value());
        CHECK(split->trainValSamples == dataset->samples.size());
    }

    SUBCASE("a record without key is a schema violation") {
        auto test = readJsonLines(root / "test" / "test.jsonl");
        REQUIRE(test.has_value());
        test->back().erase("key");
        REQUIRE(writeJsonLines(root / "test" / "test.jsonl", *test).has_value());
        auto broken = verifyDatasetAt(root);
        REQUIRE_FALSE(broken.has_value());
        CHECK(broken.error().code == Error::Code::SchemaViolation);
    }

    SUBCASE("report file") {
        auto path = dir.path() / "reports" / kVerifyReportFile;
        REQUIRE(writeReport(*report, path).has_value());
        auto written = readJsonFile(path);
        REQUIRE(written.has_value());
        CHECK(*written == report->toJson());
    }
}

TEST_CASE("missing directory and malformed lines") {
    Test::TempDir dir("verify_errors");

    auto missing = verifyDatasetAt(dir.path() / "absent");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);

    Test::writeText(dir.path() / "bad" / "data.jsonl", "{\"key\": \"2024-03-01\"}\nnot json\n");
    auto malformed = verifyDatasetAt(dir.path() / "bad");
    REQUIRE_FALSE(malformed.has_value());
    CHECK(malformed.error().code == Error::Code::MalformedInput);
}

} // TEST_SUITE
