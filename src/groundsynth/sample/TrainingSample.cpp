#include "sample/TrainingSample.hpp"

#include "io/JsonFiles.hpp"

#include <cmath>

namespace GS {
namespace {

using Json = nlohmann::json;

constexpr std::string_view kNoTargetMarker = "none";

auto schema(std::string message) -> Error {
    return makeError(Error::Code::SchemaViolation, std::move(message));
}

auto readUnitPair(Json const& node) -> std::optional<UnitPair> {
    if (!node.is_array() || node.size() != 2)
        return std::nullopt;
    auto x = jsonToInt(node[0]);
    auto y = jsonToInt(node[1]);
    if (!x || !y)
        return std::nullopt;
    return UnitPair{*x, *y};
}

} // namespace

auto actionKindToString(ActionKind kind) -> std::string_view {
    switch (kind) {
    case ActionKind::DoubleClick:
        return "double_click";
    case ActionKind::LeftClick:
        return "left_click";
    case ActionKind::Wait:
        return "wait";
    case ActionKind::Scroll:
        return "scroll";
    }
    return "left_click";
}

auto parseActionKind(std::string_view text) -> std::optional<ActionKind> {
    if (text == "double_click")
        return ActionKind::DoubleClick;
    if (text == "left_click")
        return ActionKind::LeftClick;
    if (text == "wait")
        return ActionKind::Wait;
    if (text == "scroll")
        return ActionKind::Scroll;
    return std::nullopt;
}

auto splitToString(Split split) -> std::string_view {
    switch (split) {
    case Split::Unassigned:
        return "unassigned";
    case Split::Train:
        return "train";
    case Split::Val:
        return "val";
    case Split::Test:
        return "test";
    }
    return "unassigned";
}

auto parseSplit(std::string_view text) -> std::optional<Split> {
    if (text == "train")
        return Split::Train;
    if (text == "val")
        return Split::Val;
    if (text == "test")
        return Split::Test;
    if (text == "unassigned")
        return Split::Unassigned;
    return std::nullopt;
}

auto isSpatial(ActionKind kind) -> bool {
    return kind == ActionKind::DoubleClick || kind == ActionKind::LeftClick;
}

auto validateAction(Action const& action, SurfaceRef const& imageSurface) -> Expected<void> {
    auto const* tolerance = std::get_if<UnitPair>(&action.tolerance);

    if (action.coordinate) {
        if (action.coordinate->surface != imageSurface.id) {
            return std::unexpected(makeError(Error::Code::SurfaceMismatch,
                                             "coordinate was normalised on surface '"
                                                 + action.coordinate->surface.str() + "' but the image is '"
                                                 + imageSurface.id.str() + "'"));
        }
        if (!inUnitRange(action.coordinate->units))
            return std::unexpected(schema("coordinate lies outside [0, 1000]"));
        if (tolerance == nullptr)
            return std::unexpected(schema("a coordinate needs a unit tolerance, not the no-target marker"));
        if (action.coordinate->units == UnitPair{0, 0} && *tolerance == UnitPair{0, 0})
            return std::unexpected(schema("all-zero coordinate with zero tolerance is a placeholder, not a target"));
    }
    if (tolerance != nullptr && (tolerance->x < 0 || tolerance->y < 0))
        return std::unexpected(schema("tolerance must be non-negative"));

    switch (action.kind) {
    case ActionKind::DoubleClick:
    case ActionKind::LeftClick:
        if (!action.coordinate)
            return std::unexpected(schema(std::string(actionKindToString(action.kind)) + " needs a coordinate"));
        break;
    case ActionKind::Wait:
        if (!action.durationSeconds || !(*action.durationSeconds > 0.0))
            return std::unexpected(schema("wait needs a positive duration"));
        if (!action.coordinate && tolerance != nullptr)
            return std::unexpected(schema("wait without a target must carry the no-target marker"));
        break;
    case ActionKind::Scroll:
        if (!action.scrollPixels)
            return std::unexpected(schema("scroll needs a pixel amount"));
        break;
    }
    return {};
}

auto TrainingSample::make(SampleDraft draft) -> Expected<TrainingSample> {
    if (draft.prompt.empty())
        return std::unexpected(schema("sample '" + draft.id + "' has an empty prompt"));
    if (draft.image.surface.id.empty() || draft.image.surface.width <= 0 || draft.image.surface.height <= 0)
        return std::unexpected(schema("sample '" + draft.id + "' has no image surface"));
    if (auto valid = validateAction(draft.action, draft.image.surface); !valid) {
        auto error = valid.error();
        error.message = "sample '" + draft.id + "': " + error.message.value_or("");
        return std::unexpected(error);
    }
    return TrainingSample(std::move(draft));
}

auto TrainingSample::toRecordJson() const -> Json {
    auto const& action = draft_.action;
    Json        actionJson = Json::object();
    actionJson["kind"]    = actionKindToString(action.kind);
    actionJson["surface"] = draft_.image.surface.id.str();
    if (action.coordinate)
        actionJson["coordinate"] = Json::array({action.coordinate->units.x, action.coordinate->units.y});
    if (auto const* tolerance = std::get_if<UnitPair>(&action.tolerance))
        actionJson["tolerance"] = Json::array({tolerance->x, tolerance->y});
    else
        actionJson["tolerance"] = kNoTargetMarker;
    if (action.durationSeconds)
        actionJson["duration"] = *action.durationSeconds;
    if (action.scrollPixels)
        actionJson["pixels"] = *action.scrollPixels;

    Json record = Json::object();
    record["id"]         = draft_.id;
    record["task_type"]  = draft_.taskKind;
    record["prompt"]     = draft_.prompt;
    record["action"]     = std::move(actionJson);
    record["image"]      = draft_.image.relativePath;
    record["image_size"] = Json::array({draft_.image.surface.width, draft_.image.surface.height});
    record["split"]      = splitToString(split_);
    record["key"]        = draft_.disjointnessKey;
    record["response"]   = toolCallText();
    record["metadata"]   = draft_.metadata;
    return record;
}

auto TrainingSample::toolCallText() const -> std::string {
    auto const& action    = draft_.action;
    Json        arguments = Json::object();
    arguments["action"]   = actionKindToString(action.kind);
    if (action.coordinate)
        arguments["coordinate"] = Json::array({action.coordinate->units.x, action.coordinate->units.y});
    if (action.durationSeconds)
        arguments["time"] = *action.durationSeconds;
    if (action.scrollPixels)
        arguments["pixels"] = *action.scrollPixels;
    Json call = Json::object();
    call["name"]      = "computer_use";
    call["arguments"] = std::move(arguments);
    return "<tool_call>\n" + call.dump() + "\n</tool_call>";
}

auto TrainingSample::fromRecordJson(Json const& record) -> Expected<TrainingSample> {
    if (!record.is_object())
        return std::unexpected(makeError(Error::Code::MalformedInput, "sample record must be an object"));

    SampleDraft draft;
    for (auto [field, target] : {std::pair{"id", &draft.id},
                                 std::pair{"task_type", &draft.taskKind},
                                 std::pair{"prompt", &draft.prompt},
                                 std::pair{"key", &draft.disjointnessKey}}) {
        auto text = readStringField(record, field, std::string{}, Error::Code::SchemaViolation);
        if (!text)
            return std::unexpected(schema("sample '" + draft.id + "': " + text.error().message.value_or("")));
        *target = std::move(*text);
    }
    if (auto metadataIt = record.find("metadata"); metadataIt != record.end()) {
        if (!metadataIt->is_object())
            return std::unexpected(schema("sample '" + draft.id + "' metadata must be an object"));
        draft.metadata = *metadataIt;
    } else {
        draft.metadata = Json::object();
    }

    auto imageIt = record.find("image");
    if (imageIt == record.end() || !imageIt->is_string() || imageIt->get<std::string>().empty())
        return std::unexpected(schema("sample '" + draft.id + "' has no image path"));
    draft.image.relativePath = imageIt->get<std::string>();

    auto size = readUnitPair(record.value("image_size", Json()));
    if (!size)
        return std::unexpected(schema("sample '" + draft.id + "' has no image_size"));

    auto actionIt = record.find("action");
    if (actionIt == record.end() || !actionIt->is_object())
        return std::unexpected(schema("sample '" + draft.id + "' has no action"));
    auto const& actionJson = *actionIt;

    auto kindText = readStringField(actionJson, "kind", std::string{}, Error::Code::SchemaViolation);
    auto kind     = kindText ? parseActionKind(*kindText) : std::nullopt;
    if (!kind)
        return std::unexpected(schema("sample '" + draft.id + "' has an unknown action kind"));
    draft.action.kind = *kind;

    auto surface = readStringField(actionJson, "surface", "full", Error::Code::SchemaViolation);
    if (!surface)
        return std::unexpected(schema("sample '" + draft.id + "': " + surface.error().message.value_or("")));
    draft.image.surface = SurfaceRef{SurfaceId{std::move(*surface)}, size->x, size->y};

    auto toleranceIt = actionJson.find("tolerance");
    if (toleranceIt == actionJson.end() || toleranceIt->is_null())
        return std::unexpected(schema("sample '" + draft.id + "' has no tolerance"));
    if (toleranceIt->is_string() && toleranceIt->get<std::string>() == kNoTargetMarker) {
        draft.action.tolerance = NoSpatialTarget{};
    } else if (auto pair = readUnitPair(*toleranceIt)) {
        draft.action.tolerance = *pair;
    } else {
        return std::unexpected(schema("sample '" + draft.id + "' has a malformed tolerance"));
    }

    if (auto coordinateIt = actionJson.find("coordinate"); coordinateIt != actionJson.end()) {
        auto pair = readUnitPair(*coordinateIt);
        if (!pair)
            return std::unexpected(schema("sample '" + draft.id + "' has a malformed coordinate"));
        draft.action.coordinate = SurfacePoint{draft.image.surface.id, *pair};
    }
    if (auto durationIt = actionJson.find("duration"); durationIt != actionJson.end()) {
        if (!durationIt->is_number())
            return std::unexpected(schema("sample '" + draft.id + "' duration must be a number"));
        draft.action.durationSeconds = durationIt->get<double>();
    }
    if (auto pixelsIt = actionJson.find("pixels"); pixelsIt != actionJson.end()) {
        auto pixels = jsonToInt(*pixelsIt);
        if (!pixels)
            return std::unexpected(schema("sample '" + draft.id + "' pixels must be an integer"));
        draft.action.scrollPixels = *pixels;
    }

    auto sample = make(std::move(draft));
    if (!sample)
        return sample;
    auto splitText = readStringField(record, "split", "unassigned", Error::Code::SchemaViolation);
    auto split     = splitText ? parseSplit(*splitText) : std::nullopt;
    if (!split)
        return std::unexpected(schema("sample '" + sample->id() + "' has an unknown split"));
    sample->setSplit(*split);
    return sample;
}

} // namespace GS
