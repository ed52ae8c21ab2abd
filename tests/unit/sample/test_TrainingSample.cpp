#include <doctest/doctest.h>
#include "sample/TrainingSample.hpp"

#include <initializer_list>
#include <string>

using namespace GS;
using Json = nlohmann::json;

namespace {

auto fullSurface() -> SurfaceRef {
    return SurfaceRef{fullFrameSurfaceId(), 1920, 1080};
}

auto clickDraft() -> SampleDraft {
    SampleDraft draft;
    draft.id                = "click-desktop-icon_00003_desktop_od";
    draft.taskKind          = "click-desktop-icon";
    draft.prompt            = "Double-click on the Open Dental icon on the desktop.";
    draft.action.kind       = ActionKind::DoubleClick;
    draft.action.coordinate = SurfacePoint{fullFrameSurfaceId(), UnitPair{19, 34}};
    draft.action.tolerance  = UnitPair{14, 25};
    draft.image.surface     = fullSurface();
    draft.disjointnessKey   = "2024-06-01";
    return draft;
}

auto waitDraft() -> SampleDraft {
    SampleDraft draft;
    draft.id                     = "wait-loading_00004_wait";
    draft.taskKind               = "wait-loading";
    draft.prompt                 = "The application is loading. What should you do?";
    draft.action.kind            = ActionKind::Wait;
    draft.action.durationSeconds = 3.0;
    draft.action.tolerance       = NoSpatialTarget{};
    draft.image.surface          = fullSurface();
    draft.disjointnessKey        = "2024-06-02";
    return draft;
}

auto codeOf(SampleDraft draft) -> Error::Code {
    auto sample = TrainingSample::make(std::move(draft));
    REQUIRE_FALSE(sample.has_value());
    return sample.error().code;
}

} // namespace

TEST_SUITE("sample.training_sample") {

TEST_CASE("valid click and wait samples") {
    auto click = TrainingSample::make(clickDraft());
    REQUIRE(click.has_value());
    CHECK(click->split() == Split::Unassigned);
    CHECK(click->disjointnessKey() == "2024-06-01");

    auto wait = TrainingSample::make(waitDraft());
    REQUIRE(wait.has_value());
    CHECK(std::holds_alternative<NoSpatialTarget>(wait->action().tolerance));
}

TEST_CASE("coordinate from another surface is a mismatch") {
    auto draft              = clickDraft();
    draft.action.coordinate = SurfacePoint{SurfaceId{"desktop"}, UnitPair{19, 34}};
    CHECK(codeOf(draft) == Error::Code::SurfaceMismatch);

    auto cropImage          = clickDraft();
    cropImage.image.surface = SurfaceRef{SurfaceId{"desktop"}, 1920, 1032};
    CHECK(codeOf(cropImage) == Error::Code::SurfaceMismatch);
}

TEST_CASE("schema rules") {
    SUBCASE("click without coordinate") {
        auto draft = clickDraft();
        draft.action.coordinate.reset();
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);
    }
    SUBCASE("coordinate with the no-target marker") {
        auto draft             = clickDraft();
        draft.action.tolerance = NoSpatialTarget{};
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);

        auto wait              = waitDraft();
        wait.action.coordinate = SurfacePoint{fullFrameSurfaceId(), UnitPair{500, 500}};
        CHECK(codeOf(wait) == Error::Code::SchemaViolation);
    }
    SUBCASE("all-zero placeholder") {
        auto wait              = waitDraft();
        wait.action.coordinate = SurfacePoint{fullFrameSurfaceId(), UnitPair{0, 0}};
        wait.action.tolerance  = UnitPair{0, 0};
        CHECK(codeOf(wait) == Error::Code::SchemaViolation);
    }
    SUBCASE("wait without target but with a unit tolerance") {
        auto wait             = waitDraft();
        wait.action.tolerance = UnitPair{5, 5};
        CHECK(codeOf(wait) == Error::Code::SchemaViolation);
    }
    SUBCASE("wait needs a positive duration") {
        auto wait                   = waitDraft();
        wait.action.durationSeconds = 0.0;
        CHECK(codeOf(wait) == Error::Code::SchemaViolation);
        wait.action.durationSeconds.reset();
        CHECK(codeOf(wait) == Error::Code::SchemaViolation);
    }
    SUBCASE("coordinate out of unit range") {
        auto draft              = clickDraft();
        draft.action.coordinate = SurfacePoint{fullFrameSurfaceId(), UnitPair{1001, 20}};
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);
    }
    SUBCASE("negative tolerance") {
        auto draft             = clickDraft();
        draft.action.tolerance = UnitPair{-1, 3};
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);
    }
    SUBCASE("scroll needs pixels") {
        auto draft        = clickDraft();
        draft.action.kind = ActionKind::Scroll;
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);
        draft.action.scrollPixels = -120;
        CHECK(TrainingSample::make(draft).has_value());
    }
    SUBCASE("empty prompt or image surface") {
        auto draft   = clickDraft();
        draft.prompt = "";
        CHECK(codeOf(draft) == Error::Code::SchemaViolation);

        auto noImage          = waitDraft();
        noImage.image.surface = SurfaceRef{};
        CHECK(codeOf(noImage) == Error::Code::SchemaViolation);
    }
}

TEST_CASE("error message names the sample") {
    auto draft = clickDraft();
    draft.action.coordinate.reset();
    auto sample = TrainingSample::make(draft);
    REQUIRE_FALSE(sample.has_value());
    CHECK(sample.error().message->find("click-desktop-icon_00003_desktop_od") != std::string::npos);
}

TEST_CASE("record json layout") {
    auto sample = TrainingSample::make(clickDraft());
    REQUIRE(sample.has_value());
    sample->setImagePath("images/click-desktop-icon_00003.png");
    sample->setSplit(Split::Val);

    auto record = sample->toRecordJson();
    CHECK(record["id"] == "click-desktop-icon_00003_desktop_od");
    CHECK(record["task_type"] == "click-desktop-icon");
    CHECK(record["split"] == "val");
    CHECK(record["key"] == "2024-06-01");
    CHECK(record["image"] == "images/click-desktop-icon_00003.png");
    CHECK(record["image_size"] == Json::array({1920, 1080}));
    CHECK(record["action"]["kind"] == "double_click");
    CHECK(record["action"]["surface"] == "full");
    CHECK(record["action"]["coordinate"] == Json::array({19, 34}));
    CHECK(record["action"]["tolerance"] == Json::array({14, 25}));
    CHECK_FALSE(record["action"].contains("duration"));

    auto wait = TrainingSample::make(waitDraft());
    REQUIRE(wait.has_value());
    auto waitRecord = wait->toRecordJson();
    CHECK(waitRecord["action"]["tolerance"] == "none");
    CHECK(waitRecord["action"]["duration"] == 3.0);
    CHECK_FALSE(waitRecord["action"].contains("coordinate"));
}

TEST_CASE("tool call response") {
    auto click = TrainingSample::make(clickDraft());
    REQUIRE(click.has_value());
    CHECK(click->toolCallText()
          == "<tool_call>\n{\"arguments\":{\"action\":\"double_click\",\"coordinate\":[19,34]},\"name\":\"computer_use\"}"
             "\n</tool_call>");

    auto wait = TrainingSample::make(waitDraft());
    REQUIRE(wait.has_value());
    auto text = wait->toolCallText();
    CHECK(text.find("\"action\":\"wait\"") != std::string::npos);
    CHECK(text.find("\"time\":3.0") != std::string::npos);
}

TEST_CASE("records read back into equal samples") {
    auto sample = TrainingSample::make(waitDraft());
    REQUIRE(sample.has_value());
    sample->setImagePath("test/images/wait-loading_00004.png");
    sample->setSplit(Split::Test);

    auto back = TrainingSample::fromRecordJson(sample->toRecordJson());
    REQUIRE(back.has_value());
    CHECK(back->toRecordJson() == sample->toRecordJson());
    CHECK(back->split() == Split::Test);
}

TEST_CASE("incomplete records are schema violations") {
    auto sample = TrainingSample::make(clickDraft());
    REQUIRE(sample.has_value());
    sample->setImagePath("images/a.png");
    auto const record = sample->toRecordJson();

    SUBCASE("missing tolerance") {
        auto broken = record;
        broken["action"].erase("tolerance");
        auto read = TrainingSample::fromRecordJson(broken);
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error().code == Error::Code::SchemaViolation);
    }
    SUBCASE("missing image") {
        auto broken = record;
        broken.erase("image");
        auto read = TrainingSample::fromRecordJson(broken);
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error().code == Error::Code::SchemaViolation);
    }
    SUBCASE("unknown action kind") {
        auto broken              = record;
        broken["action"]["kind"] = "drag";
        CHECK_FALSE(TrainingSample::fromRecordJson(broken).has_value());
    }
    SUBCASE("unknown split") {
        auto broken     = record;
        broken["split"] = "holdout";
        CHECK_FALSE(TrainingSample::fromRecordJson(broken).has_value());
    }
    SUBCASE("wrongly typed fields") {
        for (auto mutate : std::initializer_list<void (*)(Json&)>{
                 [](Json& r) { r["split"] = 3; },
                 [](Json& r) { r["id"] = Json::array(); },
                 [](Json& r) { r["action"]["kind"] = 7; },
                 [](Json& r) { r["action"]["surface"] = false; },
                 [](Json& r) { r["action"]["duration"] = "3"; },
                 [](Json& r) { r["metadata"] = "none"; },
                 [](Json& r) { r["image_size"] = {1920, 4294967296LL}; },
             }) {
            auto broken = record;
            mutate(broken);
            auto read = TrainingSample::fromRecordJson(broken);
            REQUIRE_FALSE(read.has_value());
            CHECK(read.error().code == Error::Code::SchemaViolation);
        }
    }
    SUBCASE("not an object") {
        auto read = TrainingSample::fromRecordJson(Json::array());
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("enum strings") {
    CHECK(parseActionKind("left_click") == ActionKind::LeftClick);
    CHECK_FALSE(parseActionKind("hover").has_value());
    CHECK(parseSplit(splitToString(Split::Train)) == Split::Train);
    CHECK(isSpatial(ActionKind::DoubleClick));
    CHECK_FALSE(isSpatial(ActionKind::Wait));
}

} // TEST_SUITE
