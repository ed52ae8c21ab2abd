#pragma once

#include "core/Error.hpp"
#include "geometry/Coordinates.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace GS {

enum class ActionKind {
    DoubleClick,
    LeftClick,
    Wait,
    Scroll
};

enum class Split {
    Unassigned,
    Train,
    Val,
    Test
};

[[nodiscard]] auto actionKindToString(ActionKind kind) -> std::string_view;
[[nodiscard]] auto parseActionKind(std::string_view text) -> std::optional<ActionKind>;
[[nodiscard]] auto splitToString(Split split) -> std::string_view;
[[nodiscard]] auto parseSplit(std::string_view text) -> std::optional<Split>;

// True for actions whose meaning depends on a screen position.
[[nodiscard]] auto isSpatial(ActionKind kind) -> bool;

// Marks an action that deliberately has no screen target; persisted as "none".
struct NoSpatialTarget {
    friend bool operator==(NoSpatialTarget, NoSpatialTarget) { return true; }
};

using Tolerance = std::variant<UnitPair, NoSpatialTarget>;

struct Action {
    ActionKind                  kind = ActionKind::LeftClick;
    std::optional<SurfacePoint> coordinate;
    Tolerance                   tolerance = NoSpatialTarget{};
    std::optional<double>       durationSeconds;
    std::optional<int>          scrollPixels;
};

struct SampleImage {
    SurfaceRef  surface;
    std::string relativePath; // filled in by the assembler once the surface is written
};

struct SampleDraft {
    std::string    id;
    std::string    taskKind;
    std::string    prompt;
    Action         action;
    SampleImage    image;
    std::string    disjointnessKey;
    nlohmann::json metadata = nlohmann::json::object();
};

class TrainingSample {
public:
    /**
     * Validates a draft and builds the sample.
     *
     * Rejects a coordinate computed on a different surface than the image
     * (SurfaceMismatch), a click without coordinate or tolerance, a wait whose
     * coordinate is paired with the no-target marker, and the all-zero
     * coordinate/tolerance placeholder (SchemaViolation).
     */
    [[nodiscard]] static auto make(SampleDraft draft) -> Expected<TrainingSample>;
    [[nodiscard]] static auto fromRecordJson(nlohmann::json const& record) -> Expected<TrainingSample>;

    [[nodiscard]] auto id() const -> std::string const& { return draft_.id; }
    [[nodiscard]] auto taskKind() const -> std::string const& { return draft_.taskKind; }
    [[nodiscard]] auto prompt() const -> std::string const& { return draft_.prompt; }
    [[nodiscard]] auto action() const -> Action const& { return draft_.action; }
    [[nodiscard]] auto image() const -> SampleImage const& { return draft_.image; }
    [[nodiscard]] auto split() const -> Split { return split_; }
    [[nodiscard]] auto disjointnessKey() const -> std::string const& { return draft_.disjointnessKey; }
    [[nodiscard]] auto metadata() const -> nlohmann::json const& { return draft_.metadata; }

    auto setSplit(Split split) -> void { split_ = split; }
    auto setImagePath(std::string relativePath) -> void { draft_.image.relativePath = std::move(relativePath); }

    [[nodiscard]] auto toRecordJson() const -> nlohmann::json;
    // Assistant response in the <tool_call> format the model is trained on.
    [[nodiscard]] auto toolCallText() const -> std::string;

private:
    explicit TrainingSample(SampleDraft draft)
        : draft_(std::move(draft)) {}

    SampleDraft draft_;
    Split       split_ = Split::Unassigned;
};

[[nodiscard]] auto validateAction(Action const& action, SurfaceRef const& imageSurface) -> Expected<void>;

} // namespace GS
