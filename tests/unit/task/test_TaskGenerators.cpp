#include <doctest/doctest.h>
#include "../GroundSynthTestHelper.hpp"
#include "render/SceneRenderer.hpp"
#include "scene/SceneSampler.hpp"
#include "task/IconTasks.hpp"
#include "task/TaskRegistry.hpp"
#include "task/WaitLoadingTask.hpp"

#include <algorithm>
#include <set>

using namespace GS;

namespace {

auto fixedScene(bool loading) -> SceneState {
    SceneState scene;
    scene.desktopIcons = {
        IconPlacement{"alpha", IconGroup::Desktop, "Alpha", PixelRect{4, 4, 20, 20}},
        IconPlacement{"gamma", IconGroup::Desktop, "Gamma", PixelRect{4, 52, 20, 20}},
        IconPlacement{"delta", IconGroup::Desktop, "Delta", PixelRect{28, 4, 20, 20}},
    };
    scene.taskbarIcons = {
        IconPlacement{"browser", IconGroup::Taskbar, "Browser", PixelRect{94, 104, 12, 12}},
        IconPlacement{"alpha", IconGroup::Taskbar, "Alpha", PixelRect{108, 104, 12, 12}},
    };
    scene.datetime.day       = std::chrono::sys_days{std::chrono::year{2024} / 8 / 15};
    scene.datetime.minuteOfDay = 600;
    scene.loadingVisible     = loading;
    scene.lineage            = RngLineage{.seed = 9, .sceneIndex = 31, .drawsBefore = 120};
    return scene;
}

struct Fixture {
    std::shared_ptr<const LayoutCatalog> catalog = Test::smallCatalog();
    SchematicRenderer                    renderer{*catalog};

    auto frameFor(SceneState const& scene) const -> RenderedFrame {
        auto frame = renderer.render(scene, *catalog);
        REQUIRE(frame.has_value());
        return std::move(*frame);
    }
};

} // namespace

TEST_SUITE("task.generators") {

TEST_CASE("desktop click samples point at icon centres on the full frame") {
    Fixture       fx;
    auto          scene = fixedScene(false);
    auto          frame = fx.frameFor(scene);
    IconClickTask task(fx.catalog, IconGroup::Desktop, TaskOptions{});
    Rng           rng(1);

    auto samples = task.generate(scene, frame, rng);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 3);
    CHECK(rng.draws() == 0);

    auto const& first = samples->front();
    CHECK(first.id() == "click-desktop-icon_00031_desktop_alpha");
    CHECK(first.prompt() == "Double-click on the Alpha icon on the desktop.");
    CHECK(first.action().kind == ActionKind::DoubleClick);
    CHECK(first.image().surface == frame.fullFrame().ref);
    REQUIRE(first.action().coordinate.has_value());
    CHECK(first.action().coordinate->surface == fullFrameSurfaceId());
    // Centre (14, 14) on 200x120 and half extent (10, 10).
    CHECK(first.action().coordinate->units == UnitPair{70, 117});
    CHECK(std::get<UnitPair>(first.action().tolerance) == UnitPair{50, 83});
    CHECK(first.disjointnessKey() == "2024-08-15");
    CHECK(first.metadata()["icon_required"] == true);
    CHECK(first.metadata()["ground_truth"]["lineage"]["scene_index"] == 31);

    for (auto const& sample : *samples) {
        auto pixel = denormalizePoint(*sample.action().coordinate, frame.fullFrame().ref);
        REQUIRE(pixel.has_value());
        auto const* placed = scene.findIcon(IconGroup::Desktop, sample.metadata()["icon_id"].get<std::string>());
        REQUIRE(placed != nullptr);
        CHECK(placed->bounds.contains(*pixel));
    }
}

TEST_CASE("taskbar click samples use the taskbar prompt") {
    Fixture       fx;
    auto          scene = fixedScene(false);
    auto          frame = fx.frameFor(scene);
    IconClickTask task(fx.catalog, IconGroup::Taskbar, TaskOptions{});
    Rng           rng(1);

    auto samples = task.generate(scene, frame, rng);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 2);
    CHECK(task.kind() == kClickTaskbarIconKind);
    CHECK(samples->back().prompt() == "Double-click on Alpha in the taskbar.");
    CHECK(samples->back().id() == "click-taskbar-icon_00031_taskbar_alpha");
    CHECK(samples->back().image().surface.id == fullFrameSurfaceId());
}

TEST_CASE("tolerance scale widens the target and never reaches zero") {
    Fixture     fx;
    auto        scene = fixedScene(false);
    auto        frame = fx.frameFor(scene);
    TaskOptions wide;
    wide.toleranceScale = 1.5;
    auto target         = spatialTargetFor(PixelRect{4, 4, 20, 20}, frame.fullFrame(), wide.toleranceScale);
    REQUIRE(target.has_value());
    CHECK(target->tolerance == UnitPair{75, 125});

    auto tiny = spatialTargetFor(PixelRect{4, 4, 1, 1}, frame.fullFrame(), 1.0);
    REQUIRE(tiny.has_value());
    CHECK(tiny->tolerance == UnitPair{1, 1});

    auto zero = spatialTargetFor(PixelRect{4, 4, 20, 20}, frame.fullFrame(), 0.0);
    REQUIRE_FALSE(zero.has_value());
    CHECK(zero.error().code == Error::Code::ConfigurationError);
}

TEST_CASE("targets on a crop are expressed in crop units") {
    Fixture fx;
    auto    scene = fixedScene(false);
    auto    frame = fx.frameFor(scene);
    auto    crop  = frame.surface(SurfaceId{"desktop"});
    REQUIRE(crop.has_value());
    auto target = spatialTargetFor(PixelRect{4, 4, 20, 20}, **crop, 1.0);
    REQUIRE(target.has_value());
    CHECK(target->point.surface == SurfaceId{"desktop"});
    CHECK(target->point.units == UnitPair{70, 140});

    auto offCrop = spatialTargetFor(PixelRect{94, 104, 12, 12}, **crop, 1.0);
    REQUIRE_FALSE(offCrop.has_value());
    CHECK(offCrop.error().code == Error::Code::SurfaceMismatch);
}

TEST_CASE("icons unknown to the catalog are a configuration error") {
    Fixture fx;
    auto    scene = fixedScene(false);
    scene.desktopIcons.push_back(IconPlacement{"zeta", IconGroup::Desktop, "Zeta", PixelRect{28, 52, 20, 20}});
    auto          frame = fx.frameFor(scene);
    IconClickTask task(fx.catalog, IconGroup::Desktop, TaskOptions{});
    Rng           rng(1);
    auto          samples = task.generate(scene, frame, rng);
    REQUIRE_FALSE(samples.has_value());
    CHECK(samples.error().code == Error::Code::ConfigurationError);
}

TEST_CASE("icon list prompts enumerate the placement order") {
    Fixture      fx;
    auto         scene = fixedScene(false);
    auto         frame = fx.frameFor(scene);
    IconListTask task(fx.catalog, TaskOptions{});
    Rng          rng(1);

    auto samples = task.generate(scene, frame, rng);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 3);
    CHECK((*samples)[1].prompt() == "Icons: Alpha, Gamma, Delta. Open Gamma.");
    CHECK((*samples)[1].metadata()["list_index"] == 1);
    CHECK((*samples)[1].image().surface.id == fullFrameSurfaceId());
    std::vector<std::string> vocabulary{"Alpha", "Beta", "Gamma", "Delta", "Epsilon"};
    for (auto const& sample : *samples) {
        auto listed = parseListedLabels(fx.catalog->listPromptTemplate(), sample.prompt(), vocabulary);
        REQUIRE(listed.has_value());
        CHECK(*listed == std::vector<std::string>{"Alpha", "Gamma", "Delta"});
    }

    SUBCASE("a relabelled placement is rejected") {
        scene.desktopIcons[2].label = "Renamed";
        auto relabelled             = task.generate(scene, frame, rng);
        REQUIRE_FALSE(relabelled.has_value());
        CHECK(relabelled.error().code == Error::Code::SchemaViolation);
    }
}

TEST_CASE("list prompt templates") {
    CHECK(renderListPrompt("[icon_list] -> [icon_label]", {"A", "B"}, "B") == "A, B -> B");
    CHECK(renderListPrompt("[icon_list]", {}, "A") == "");

    std::vector<std::string> const vocabulary{"A", "B", "One", "Two", "Three"};
    auto parsed = parseListedLabels("Visible: [icon_list]. Pick [icon_label].", "Visible: One, Two, Three. Pick Two.",
                                    vocabulary);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == std::vector<std::string>{"One", "Two", "Three"});

    auto noList = parseListedLabels("Pick [icon_label].", "Pick Two.", vocabulary);
    REQUIRE_FALSE(noList.has_value());
    CHECK(noList.error().code == Error::Code::ConfigurationError);

    auto labelFirst = parseListedLabels("Pick [icon_label] from [icon_list]", "Pick A from A, B", vocabulary);
    REQUIRE_FALSE(labelFirst.has_value());
    CHECK(labelFirst.error().code == Error::Code::ConfigurationError);

    auto wrongPrefix = parseListedLabels("Visible: [icon_list].", "Shown: A.", vocabulary);
    REQUIRE_FALSE(wrongPrefix.has_value());
    CHECK(wrongPrefix.error().code == Error::Code::SchemaViolation);

    auto unknown = parseListedLabels("Visible: [icon_list].", "Visible: One, Four.", vocabulary);
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == Error::Code::SchemaViolation);

    SUBCASE("labels containing the separator stay whole") {
        std::vector<std::string> const withComma{"Notes", "Notes, Drafts", "Two"};
        auto listed = parseListedLabels("Visible: [icon_list]. Pick [icon_label].",
                                        "Visible: Notes, Drafts, Two, Notes. Pick Two.", withComma);
        REQUIRE(listed.has_value());
        CHECK(*listed == std::vector<std::string>{"Notes, Drafts", "Two", "Notes"});
    }
}

TEST_CASE("icon list accepts a catalog label with a comma") {
    auto layout = Test::smallLayoutJson();
    for (auto& element : layout["elements"]) {
        if (element["id"] == "gamma")
            element["label"] = "Reports, 2024";
    }
    auto catalog = LayoutCatalog::fromJson(layout);
    REQUIRE(catalog.has_value());
    SchematicRenderer renderer(**catalog);
    auto              scene     = fixedScene(false);
    scene.desktopIcons[1].label = "Reports, 2024";
    auto frame                  = renderer.render(scene, **catalog);
    REQUIRE(frame.has_value());

    IconListTask task(*catalog, TaskOptions{});
    Rng          rng(1);
    auto         samples = task.generate(scene, *frame, rng);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 3);
    CHECK((*samples)[1].prompt() == "Icons: Alpha, Reports, 2024, Delta. Open Reports, 2024.");
    CHECK((*samples)[1].metadata()["list_index"] == 1);
}

TEST_CASE("click tasks sample scenes without the loading panel") {
    Fixture fx;
    CHECK(IconClickTask(fx.catalog, IconGroup::Desktop, TaskOptions{}).forcedLoading() == false);
    CHECK(IconClickTask(fx.catalog, IconGroup::Taskbar, TaskOptions{}).forcedLoading() == false);
    CHECK(IconListTask(fx.catalog, TaskOptions{}).forcedLoading() == false);
}

TEST_CASE("click test cases cover required icons with fixed tolerances") {
    Fixture fx;
    auto    scene = fixedScene(false);
    auto    frame = fx.frameFor(scene);
    Rng     rng(1);

    SUBCASE("desktop") {
        IconClickTask task(fx.catalog, IconGroup::Desktop, TaskOptions{});
        auto          cases = task.generateTest(scene, frame, rng);
        REQUIRE(cases.has_value());
        REQUIRE(cases->size() == 1);
        auto const& only = cases->front();
        CHECK(only.metadata()["icon_id"] == "alpha");
        CHECK(only.metadata()["test_case"] == true);
        CHECK(only.action().coordinate->units == UnitPair{70, 117});
        // 20 px on 200x120.
        CHECK(std::get<UnitPair>(only.action().tolerance) == UnitPair{100, 167});
    }
    SUBCASE("taskbar") {
        IconClickTask task(fx.catalog, IconGroup::Taskbar, TaskOptions{});
        auto          cases = task.generateTest(scene, frame, rng);
        REQUIRE(cases.has_value());
        REQUIRE(cases->size() == 1);
        CHECK(cases->front().id() == "click-taskbar-icon_00031_taskbar_alpha");
        // 10 px on 200x120.
        CHECK(std::get<UnitPair>(cases->front().action().tolerance) == UnitPair{50, 83});
    }
    SUBCASE("icon list") {
        IconListTask task(fx.catalog, TaskOptions{});
        auto         cases = task.generateTest(scene, frame, rng);
        REQUIRE(cases.has_value());
        REQUIRE(cases->size() == 1);
        CHECK(cases->front().prompt() == "Icons: Alpha, Gamma, Delta. Open Alpha.");
        CHECK(std::get<UnitPair>(cases->front().action().tolerance) == UnitPair{100, 167});
    }
    CHECK(rng.draws() == 0);
}

TEST_CASE("wait test cases use the fixed duration") {
    Fixture         fx;
    WaitLoadingTask task(fx.catalog, TaskOptions{});
    Rng             rng(3);

    auto idle      = fixedScene(false);
    auto idleFrame = fx.frameFor(idle);
    auto none      = task.generateTest(idle, idleFrame, rng);
    REQUIRE(none.has_value());
    CHECK(none->empty());

    auto loading = fixedScene(true);
    auto frame   = fx.frameFor(loading);
    auto cases   = task.generateTest(loading, frame, rng);
    REQUIRE(cases.has_value());
    REQUIRE(cases->size() == 1);
    auto const& only = cases->front();
    CHECK(only.prompt() == "Wait for 3 seconds.");
    CHECK(*only.action().durationSeconds == doctest::Approx(3.0));
    CHECK(std::holds_alternative<NoSpatialTarget>(only.action().tolerance));
    CHECK(only.metadata()["test_case"] == true);
    CHECK(rng.draws() == 0);
}

TEST_CASE("wait samples only for loading scenes") {
    Fixture         fx;
    WaitLoadingTask task(fx.catalog, TaskOptions{});
    CHECK(task.forcedLoading() == true);

    auto idle      = fixedScene(false);
    auto idleFrame = fx.frameFor(idle);
    Rng  rng(3);
    auto none      = task.generate(idle, idleFrame, rng);
    REQUIRE(none.has_value());
    CHECK(none->empty());
    CHECK(rng.draws() == 0);

    auto loading = fixedScene(true);
    auto frame   = fx.frameFor(loading);
    auto samples = task.generate(loading, frame, rng);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 1);
    auto const& sample = samples->front();
    CHECK(sample.action().kind == ActionKind::Wait);
    CHECK_FALSE(sample.action().coordinate.has_value());
    CHECK(std::holds_alternative<NoSpatialTarget>(sample.action().tolerance));
    REQUIRE(sample.action().durationSeconds.has_value());
    CHECK(*sample.action().durationSeconds >= 1.0);
    CHECK(*sample.action().durationSeconds <= 5.0);
    CHECK(std::find(kLoadingPrompts.begin(), kLoadingPrompts.end(), sample.prompt()) != kLoadingPrompts.end());
    CHECK(sample.metadata()["wait_target"] == "none");
    CHECK(sample.toRecordJson()["action"]["tolerance"] == "none");
}

TEST_CASE("wait durations and prompts cover their ranges") {
    Fixture         fx;
    WaitLoadingTask task(fx.catalog, TaskOptions{});
    auto            scene = fixedScene(true);
    auto            frame = fx.frameFor(scene);
    Rng             rng(12);
    std::set<int>         seconds;
    std::set<std::string> prompts;
    for (int i = 0; i < 300; ++i) {
        auto samples = task.generate(scene, frame, rng);
        REQUIRE(samples.has_value());
        seconds.insert(static_cast<int>(*samples->front().action().durationSeconds));
        prompts.insert(samples->front().prompt());
    }
    CHECK(seconds == std::set<int>{1, 2, 3, 4, 5});
    CHECK(prompts.size() == kLoadingPrompts.size());
}

TEST_CASE("indicator mode points at the loading panel") {
    Fixture     fx;
    TaskOptions options;
    options.waitTarget = WaitTargetMode::Indicator;
    WaitLoadingTask task(fx.catalog, options);
    auto            scene = fixedScene(true);
    auto            frame = fx.frameFor(scene);
    Rng             rng(3);

    auto samples = task.generate(scene, frame, rng);
    REQUIRE(samples.has_value());
    auto const& action = samples->front().action();
    REQUIRE(action.coordinate.has_value());
    CHECK(action.coordinate->surface == fullFrameSurfaceId());
    CHECK(action.coordinate->units == UnitPair{500, 417});
    CHECK(std::get<UnitPair>(action.tolerance) == UnitPair{200, 167});
    CHECK(samples->front().metadata()["wait_target"] == "indicator");
}

TEST_CASE("wait needs a loading panel and a sane range") {
    Fixture fx;
    auto    noPanel = LayoutCatalog::fromJson(nlohmann::json::parse(R"({"size": [200, 120], "elements": []})"));
    REQUIRE(noPanel.has_value());
    WaitLoadingTask task(*noPanel, TaskOptions{});
    auto            scene = fixedScene(true);
    scene.desktopIcons.clear();
    scene.taskbarIcons.clear();
    scene.loadingVisible = false;
    auto frame           = fx.frameFor(scene);
    scene.loadingVisible = true;
    Rng  rng(3);
    auto missing = task.generate(scene, frame, rng);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::ConfigurationError);

    TaskOptions inverted;
    inverted.waitMinSeconds = 4;
    inverted.waitMaxSeconds = 2;
    WaitLoadingTask badRange(fx.catalog, inverted);
    auto            loadingFrame = fx.frameFor(scene);
    auto            bad          = badRange.generate(scene, loadingFrame, rng);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == Error::Code::ConfigurationError);
}

TEST_CASE("registry") {
    auto catalog  = Test::smallCatalog();
    auto registry = makeDefaultRegistry(catalog, TaskOptions{});
    REQUIRE(registry.has_value());
    CHECK(registry->size() == 4);
    CHECK(registry->kinds()
          == std::vector<std::string>{"click-desktop-icon", "click-taskbar-icon", "iconlist", "wait-loading"});
    CHECK(registry->contains(kWaitLoadingKind));
    CHECK(registry->find("drag-window") == nullptr);

    auto duplicate = registry->add(std::make_unique<IconListTask>(catalog, TaskOptions{}));
    REQUIRE_FALSE(duplicate.has_value());
    CHECK(duplicate.error().code == Error::Code::InvalidArgument);
    CHECK_FALSE(registry->add(nullptr).has_value());
    CHECK_FALSE(makeDefaultRegistry(nullptr, TaskOptions{}).has_value());
}

TEST_CASE("sample ids") {
    CHECK(makeSampleId("iconlist", 7, "desktop_alpha") == "iconlist_00007_desktop_alpha");
    CHECK(makeSampleId("wait-loading", 123456, "") == "wait-loading_123456");
}

} // TEST_SUITE
