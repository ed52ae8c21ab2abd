#include "task/IconTasks.hpp"

#include "log/TaggedLogger.hpp"
#include "task/TaskRegistry.hpp"

#include <algorithm>

namespace GS {
namespace {

constexpr std::string_view kListToken  = "[icon_list]";
constexpr std::string_view kLabelToken = "[icon_label]";
constexpr std::string_view kSeparator  = ", ";

auto replaceAll(std::string text, std::string_view token, std::string const& value) -> std::string {
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size()))
        text.replace(pos, token.size(), value);
    return text;
}

// Looks the placement up in the catalog; a scene naming an unknown icon is a configuration error.
auto catalogIconFor(LayoutCatalog const& catalog, IconPlacement const& icon) -> Expected<LayoutElement const*> {
    auto const* element = catalog.findIcon(icon.group, icon.elementId);
    if (element == nullptr) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "scene icon '" + std::string(iconGroupToString(icon.group)) + "/"
                                             + icon.elementId + "' is not in layout '" + catalog.screenName() + "'"));
    }
    return element;
}

auto clickDraft(std::string id,
                std::string_view kind,
                std::string prompt,
                SpatialTarget const& target,
                RenderedSurface const& surface,
                SceneState const& scene) -> SampleDraft {
    SampleDraft draft;
    draft.id                = std::move(id);
    draft.taskKind          = std::string(kind);
    draft.prompt            = std::move(prompt);
    draft.action.kind       = ActionKind::DoubleClick;
    draft.action.coordinate = target.point;
    draft.action.tolerance  = target.tolerance;
    draft.image.surface     = surface.ref;
    draft.disjointnessKey   = scene.disjointnessKey();
    return draft;
}

} // namespace

IconClickTask::IconClickTask(std::shared_ptr<const LayoutCatalog> catalog, IconGroup group, TaskOptions options)
    : catalog_(std::move(catalog)), group_(group), options_(options) {}

auto IconClickTask::kind() const -> std::string_view {
    return group_ == IconGroup::Desktop ? kClickDesktopIconKind : kClickTaskbarIconKind;
}

auto IconClickTask::promptFor(IconGroup group, std::string const& label) -> std::string {
    if (group == IconGroup::Desktop)
        return "Double-click on the " + label + " icon on the desktop.";
    return "Double-click on " + label + " in the taskbar.";
}

auto IconClickTask::generate(SceneState const& scene, RenderedFrame const& frame, Rng&) const
    -> Expected<std::vector<TrainingSample>> {
    return emit(scene, frame, false);
}

auto IconClickTask::generateTest(SceneState const& scene, RenderedFrame const& frame, Rng&) const
    -> Expected<std::vector<TrainingSample>> {
    return emit(scene, frame, true);
}

auto IconClickTask::emit(SceneState const& scene, RenderedFrame const& frame, bool testCases) const
    -> Expected<std::vector<TrainingSample>> {
    auto const&                 full = frame.fullFrame();
    std::vector<TrainingSample> samples;
    auto                        shared = sceneMetadata(scene);
    auto const testTolerance = group_ == IconGroup::Desktop ? options_.desktopTestTolerancePixels
                                                            : options_.taskbarTestTolerancePixels;

    for (auto const& icon : scene.icons(group_)) {
        auto element = catalogIconFor(*catalog_, icon);
        if (!element)
            return std::unexpected(element.error());
        if (testCases && !(*element)->required)
            continue;
        auto target = testCases ? fixedTargetFor(icon.bounds, full, testTolerance)
                                : spatialTargetFor(icon.bounds, full, options_.toleranceScale);
        if (!target)
            return std::unexpected(target.error());

        auto draft = clickDraft(makeSampleId(kind(), scene.lineage.sceneIndex,
                                             std::string(iconGroupToString(group_)) + "_" + icon.elementId),
                                kind(), promptFor(group_, icon.label), *target, full, scene);
        draft.metadata = {
            {"icon_type", iconGroupToString(group_)},
            {"icon_id", icon.elementId},
            {"icon_label", icon.label},
            {"icon_required", (*element)->required},
            {"icon_bounds", {icon.bounds.x, icon.bounds.y, icon.bounds.width, icon.bounds.height}},
            {"test_case", testCases},
            {"ground_truth", shared},
        };
        auto sample = TrainingSample::make(std::move(draft));
        if (!sample)
            return std::unexpected(sample.error());
        samples.push_back(std::move(*sample));
    }
    gs_log(std::string(kind()) + ": " + std::to_string(samples.size()) + (testCases ? " test cases" : " samples")
               + " for scene " + std::to_string(scene.lineage.sceneIndex),
           "Task", "INFO");
    return samples;
}

auto renderListPrompt(std::string const& templ, std::vector<std::string> const& labels, std::string const& target)
    -> std::string {
    std::string list;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        if (i > 0)
            list.append(kSeparator);
        list.append(labels[i]);
    }
    auto withList = replaceAll(templ, kListToken, list);
    return replaceAll(std::move(withList), kLabelToken, target);
}

auto parseListedLabels(std::string const& templ, std::string const& prompt, std::vector<std::string> const& vocabulary)
    -> Expected<std::vector<std::string>> {
    auto tokenPos = templ.find(kListToken);
    if (tokenPos == std::string::npos) {
        return std::unexpected(
            makeError(Error::Code::ConfigurationError, "list prompt template has no " + std::string(kListToken)));
    }
    auto prefix = templ.substr(0, tokenPos);
    if (prefix.find(kLabelToken) != std::string::npos) {
        return std::unexpected(makeError(Error::Code::ConfigurationError,
                                         "list prompt template must name the list before the target label"));
    }
    auto afterToken = tokenPos + kListToken.size();
    auto nextToken  = templ.find('[', afterToken);
    auto suffix     = templ.substr(afterToken, nextToken == std::string::npos ? std::string::npos : nextToken - afterToken);

    if (prompt.compare(0, prefix.size(), prefix) != 0)
        return std::unexpected(makeError(Error::Code::SchemaViolation, "prompt does not start with the list prefix"));
    auto listEnd = suffix.empty() ? prompt.size() : prompt.find(suffix, prefix.size());
    if (listEnd == std::string::npos)
        return std::unexpected(makeError(Error::Code::SchemaViolation, "prompt does not close the icon list"));

    std::vector<std::string const*> longestFirst;
    for (auto const& label : vocabulary) {
        if (!label.empty())
            longestFirst.push_back(&label);
    }
    std::stable_sort(longestFirst.begin(), longestFirst.end(),
                     [](std::string const* a, std::string const* b) { return a->size() > b->size(); });

    std::vector<std::string> labels;
    std::string_view         list(prompt.data() + prefix.size(), listEnd - prefix.size());
    while (!list.empty()) {
        std::string const* match = nullptr;
        for (auto const* label : longestFirst) {
            if (!list.starts_with(*label))
                continue;
            auto rest = list.substr(label->size());
            if (rest.empty() || rest.starts_with(kSeparator)) {
                match = label;
                break;
            }
        }
        if (match == nullptr) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             "prompt lists an unknown label at '" + std::string(list) + "'"));
        }
        labels.push_back(*match);
        list.remove_prefix(match->size());
        if (list.empty())
            break;
        list.remove_prefix(kSeparator.size());
        if (list.empty())
            return std::unexpected(makeError(Error::Code::SchemaViolation, "icon list ends with a separator"));
    }
    return labels;
}

IconListTask::IconListTask(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions options)
    : catalog_(std::move(catalog)), options_(options) {}

auto IconListTask::kind() const -> std::string_view {
    return kIconListKind;
}

auto IconListTask::generate(SceneState const& scene, RenderedFrame const& frame, Rng&) const
    -> Expected<std::vector<TrainingSample>> {
    return emit(scene, frame, false);
}

auto IconListTask::generateTest(SceneState const& scene, RenderedFrame const& frame, Rng&) const
    -> Expected<std::vector<TrainingSample>> {
    return emit(scene, frame, true);
}

auto IconListTask::emit(SceneState const& scene, RenderedFrame const& frame, bool testCases) const
    -> Expected<std::vector<TrainingSample>> {
    auto const& full      = frame.fullFrame();
    auto const& templ     = catalog_->listPromptTemplate();
    auto const& placement = scene.desktopIcons;

    std::vector<std::string> vocabulary;
    for (auto const* element : catalog_->icons(IconGroup::Desktop))
        vocabulary.push_back(element->label);

    std::vector<std::string>         labels;
    std::vector<LayoutElement const*> elements;
    labels.reserve(placement.size());
    for (auto const& icon : placement) {
        auto element = catalogIconFor(*catalog_, icon);
        if (!element)
            return std::unexpected(element.error());
        if ((*element)->label != icon.label) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             "placement label '" + icon.label + "' disagrees with catalog label '"
                                                 + (*element)->label + "' for icon '" + icon.elementId + "'"));
        }
        labels.push_back(icon.label);
        elements.push_back(*element);
    }

    auto shared = sceneMetadata(scene);
    std::vector<TrainingSample> samples;
    for (std::size_t index = 0; index < placement.size(); ++index) {
        auto const& icon = placement[index];
        if (testCases && !elements[index]->required)
            continue;
        auto prompt = renderListPrompt(templ, labels, icon.label);

        auto listed = parseListedLabels(templ, prompt, vocabulary);
        if (!listed)
            return std::unexpected(listed.error());
        if (*listed != labels) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             "enumerated labels of '" + prompt + "' do not follow the placement order"));
        }
        if ((*listed)[index] != icon.label) {
            return std::unexpected(makeError(Error::Code::SchemaViolation,
                                             "target '" + icon.label + "' is not listed at position "
                                                 + std::to_string(index)));
        }

        auto target = testCases ? fixedTargetFor(icon.bounds, full, options_.desktopTestTolerancePixels)
                                : spatialTargetFor(icon.bounds, full, options_.toleranceScale);
        if (!target)
            return std::unexpected(target.error());

        auto draft = clickDraft(makeSampleId(kind(), scene.lineage.sceneIndex, "desktop_" + icon.elementId), kind(),
                                std::move(prompt), *target, full, scene);
        draft.metadata = {
            {"icon_id", icon.elementId},
            {"icon_label", icon.label},
            {"list_index", index},
            {"listed_labels", labels},
            {"icon_bounds", {icon.bounds.x, icon.bounds.y, icon.bounds.width, icon.bounds.height}},
            {"test_case", testCases},
            {"ground_truth", shared},
        };
        auto sample = TrainingSample::make(std::move(draft));
        if (!sample)
            return std::unexpected(sample.error());
        samples.push_back(std::move(*sample));
    }
    gs_log("iconlist: " + std::to_string(samples.size()) + (testCases ? " test cases" : " samples") + " for scene "
               + std::to_string(scene.lineage.sceneIndex),
           "Task", "INFO");
    return samples;
}

} // namespace GS
