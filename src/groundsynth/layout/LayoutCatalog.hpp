#pragma once

#include "core/Error.hpp"
#include "geometry/Geometry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace GS {

enum class ElementKind {
    Icon,
    Region,
    Text
};

enum class IconGroup {
    Desktop,
    Taskbar
};

[[nodiscard]] auto elementKindToString(ElementKind kind) -> std::string_view;
[[nodiscard]] auto iconGroupToString(IconGroup group) -> std::string_view;
[[nodiscard]] auto parseIconGroup(std::string_view text) -> std::optional<IconGroup>;

// Placement grid of a region: icons advance by `advance` and start a new line at `wrap`.
struct FlowLayout {
    PixelPoint origin;
    PixelPoint advance;
    PixelPoint wrap;
};

struct LayoutElement {
    std::string                id;
    ElementKind                kind     = ElementKind::Region;
    bool                       required = false;
    PixelRect                  bounds;
    std::optional<std::string> iconFile;
    std::string                label;
    std::optional<IconGroup>   group;
    std::optional<FlowLayout>  flow;
    bool                       crop              = false;
    bool                       loadingIndicator  = false;

    // Icons are keyed "<group>/<id>"; everything else by id.
    [[nodiscard]] auto key() const -> std::string;
};

/**
 * Read-only view of the addressable elements of one screen.
 *
 * Built once from the authored annotation document and shared between every
 * sampler, generator and renderer call of a run. Nothing mutates it after load.
 */
class LayoutCatalog {
public:
    [[nodiscard]] static auto fromJson(nlohmann::json const& document) -> Expected<std::shared_ptr<const LayoutCatalog>>;

    [[nodiscard]] auto screenName() const -> std::string const& { return screenName_; }
    [[nodiscard]] auto frameSize() const -> PixelSize { return frameSize_; }
    [[nodiscard]] auto frameRect() const -> PixelRect { return PixelRect{0, 0, frameSize_.width, frameSize_.height}; }
    [[nodiscard]] auto elements() const -> std::vector<LayoutElement> const& { return elements_; }
    [[nodiscard]] auto listPromptTemplate() const -> std::string const& { return listPromptTemplate_; }

    [[nodiscard]] auto find(std::string_view key) const -> LayoutElement const*;
    [[nodiscard]] auto findIcon(IconGroup group, std::string_view id) const -> LayoutElement const*;
    [[nodiscard]] auto require(std::string_view key) const -> Expected<LayoutElement const*>;

    [[nodiscard]] auto icons(IconGroup group) const -> std::vector<LayoutElement const*>;
    [[nodiscard]] auto requiredIcons(IconGroup group) const -> std::vector<LayoutElement const*>;
    [[nodiscard]] auto optionalIcons(IconGroup group) const -> std::vector<LayoutElement const*>;

    [[nodiscard]] auto regionFor(IconGroup group) const -> LayoutElement const*;
    [[nodiscard]] auto loadingIndicator() const -> LayoutElement const*;
    [[nodiscard]] auto datetimeArea() const -> LayoutElement const*;
    [[nodiscard]] auto cropRegions() const -> std::vector<LayoutElement const*>;

private:
    LayoutCatalog() = default;

    std::string                                  screenName_;
    PixelSize                                    frameSize_;
    std::string                                  listPromptTemplate_;
    std::vector<LayoutElement>                   elements_;
    std::unordered_map<std::string, std::size_t> index_;
};

[[nodiscard]] auto loadLayoutCatalog(std::filesystem::path const& path) -> Expected<std::shared_ptr<const LayoutCatalog>>;

} // namespace GS
