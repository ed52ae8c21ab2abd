#include "layout/LayoutCatalog.hpp"

#include "io/JsonFiles.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

namespace GS {
namespace {

using Json = nlohmann::json;

constexpr std::string_view kDefaultListPrompt =
    "Visible desktop icons in order: [icon_list]. Double-click the [icon_label] icon.";

auto malformed(std::string message) -> Error {
    return makeError(Error::Code::MalformedInput, std::move(message));
}

auto withOwner(Error error, std::string const& owner) -> Error {
    error.message = "element '" + owner + "': " + error.message.value_or("");
    return error;
}

auto parseKind(std::string_view text) -> std::optional<ElementKind> {
    if (text == "icon")
        return ElementKind::Icon;
    if (text == "region")
        return ElementKind::Region;
    if (text == "text")
        return ElementKind::Text;
    return std::nullopt;
}

auto parsePair(Json const& node, std::string_view what) -> Expected<PixelPoint> {
    std::optional<int> x, y;
    if (node.is_array() && node.size() == 2) {
        x = jsonToInt(node[0]);
        y = jsonToInt(node[1]);
    }
    if (!x || !y)
        return std::unexpected(malformed(std::string(what) + " must be an [x, y] integer pair"));
    return PixelPoint{*x, *y};
}

auto parseRect(Json const& node, std::string const& owner) -> Expected<PixelRect> {
    if (!node.is_array() || node.size() != 4) {
        return std::unexpected(malformed("element '" + owner + "' bbox must be [x, y, width, height]"));
    }
    int values[4];
    for (std::size_t i = 0; i < 4; ++i) {
        auto value = jsonToInt(node[i]);
        if (!value)
            return std::unexpected(malformed("element '" + owner + "' bbox must hold integers"));
        values[i] = *value;
    }
    PixelRect rect{values[0], values[1], values[2], values[3]};
    if (rect.empty())
        return std::unexpected(malformed("element '" + owner + "' has an empty bbox"));
    return rect;
}

auto parseFlow(Json const& node, std::string const& owner) -> Expected<FlowLayout> {
    if (!node.is_object())
        return std::unexpected(malformed("element '" + owner + "' flow must be an object"));
    FlowLayout flow;
    auto origin = parsePair(node.value("origin", Json()), "flow.origin");
    if (!origin)
        return std::unexpected(origin.error());
    auto advance = parsePair(node.value("advance", Json()), "flow.advance");
    if (!advance)
        return std::unexpected(advance.error());
    flow.origin  = *origin;
    flow.advance = *advance;
    if (node.contains("wrap")) {
        auto wrap = parsePair(node["wrap"], "flow.wrap");
        if (!wrap)
            return std::unexpected(wrap.error());
        flow.wrap = *wrap;
    }
    if (flow.advance.x == 0 && flow.advance.y == 0)
        return std::unexpected(malformed("element '" + owner + "' flow.advance must be non-zero"));
    return flow;
}

auto parseElement(Json const& node) -> Expected<LayoutElement> {
    if (!node.is_object())
        return std::unexpected(malformed("layout element must be an object"));
    auto idIt = node.find("id");
    if (idIt == node.end() || !idIt->is_string() || idIt->get<std::string>().empty())
        return std::unexpected(malformed("layout element is missing a string 'id'"));

    LayoutElement element;
    element.id = idIt->get<std::string>();

    auto kindText = readStringField(node, "kind", "region", Error::Code::MalformedInput);
    if (!kindText)
        return std::unexpected(withOwner(kindText.error(), element.id));
    auto kind = parseKind(*kindText);
    if (!kind)
        return std::unexpected(malformed("element '" + element.id + "' has an unknown kind"));
    element.kind = *kind;

    auto bounds = parseRect(node.value("bbox", Json()), element.id);
    if (!bounds)
        return std::unexpected(bounds.error());
    element.bounds = *bounds;

    auto required         = readBoolField(node, "required", false, Error::Code::MalformedInput);
    auto label            = readStringField(node, "label", element.id, Error::Code::MalformedInput);
    auto crop             = readBoolField(node, "crop", false, Error::Code::MalformedInput);
    auto loadingIndicator = readBoolField(node, "loading_indicator", false, Error::Code::MalformedInput);
    auto iconFile         = readStringField(node, "icon", std::string{}, Error::Code::MalformedInput);
    if (!required)
        return std::unexpected(withOwner(required.error(), element.id));
    if (!label)
        return std::unexpected(withOwner(label.error(), element.id));
    if (!crop)
        return std::unexpected(withOwner(crop.error(), element.id));
    if (!loadingIndicator)
        return std::unexpected(withOwner(loadingIndicator.error(), element.id));
    if (!iconFile)
        return std::unexpected(withOwner(iconFile.error(), element.id));
    element.required         = *required;
    element.label            = std::move(*label);
    element.crop             = *crop;
    element.loadingIndicator = *loadingIndicator;
    if (!iconFile->empty())
        element.iconFile = std::move(*iconFile);

    if (auto groupIt = node.find("group"); groupIt != node.end()) {
        auto group = groupIt->is_string() ? parseIconGroup(groupIt->get<std::string>()) : std::nullopt;
        if (!group)
            return std::unexpected(malformed("element '" + element.id + "' has an unknown group"));
        element.group = *group;
    }
    if (element.kind == ElementKind::Icon && !element.group)
        return std::unexpected(malformed("icon '" + element.id + "' needs a group"));

    if (auto flowIt = node.find("flow"); flowIt != node.end()) {
        auto flow = parseFlow(*flowIt, element.id);
        if (!flow)
            return std::unexpected(flow.error());
        element.flow = *flow;
    }
    return element;
}

} // namespace

auto elementKindToString(ElementKind kind) -> std::string_view {
    switch (kind) {
    case ElementKind::Icon:
        return "icon";
    case ElementKind::Region:
        return "region";
    case ElementKind::Text:
        return "text";
    }
    return "region";
}

auto iconGroupToString(IconGroup group) -> std::string_view {
    switch (group) {
    case IconGroup::Desktop:
        return "desktop";
    case IconGroup::Taskbar:
        return "taskbar";
    }
    return "desktop";
}

auto parseIconGroup(std::string_view text) -> std::optional<IconGroup> {
    if (text == "desktop")
        return IconGroup::Desktop;
    if (text == "taskbar")
        return IconGroup::Taskbar;
    return std::nullopt;
}

auto LayoutElement::key() const -> std::string {
    if (kind == ElementKind::Icon && group)
        return std::string(iconGroupToString(*group)) + "/" + id;
    return id;
}

auto LayoutCatalog::fromJson(Json const& document) -> Expected<std::shared_ptr<const LayoutCatalog>> {
    if (!document.is_object())
        return std::unexpected(malformed("layout document must be a JSON object"));

    std::shared_ptr<LayoutCatalog> catalog(new LayoutCatalog());
    auto screenName = readStringField(document, "screen", "desktop", Error::Code::MalformedInput);
    if (!screenName)
        return std::unexpected(screenName.error());
    catalog->screenName_ = std::move(*screenName);

    auto size = parsePair(document.value("size", Json()), "size");
    if (!size)
        return std::unexpected(size.error());
    catalog->frameSize_ = PixelSize{size->x, size->y};
    if (!catalog->frameSize_.valid())
        return std::unexpected(malformed("layout size must be positive"));

    auto listPrompt = readStringField(document, "list_prompt", std::string{kDefaultListPrompt}, Error::Code::MalformedInput);
    if (!listPrompt)
        return std::unexpected(listPrompt.error());
    catalog->listPromptTemplate_ = std::move(*listPrompt);

    auto elementsIt = document.find("elements");
    if (elementsIt == document.end() || !elementsIt->is_array())
        return std::unexpected(malformed("layout document has no 'elements' array"));

    auto const frame           = catalog->frameRect();
    bool       sawLoadingPanel = false;
    for (auto const& node : *elementsIt) {
        auto element = parseElement(node);
        if (!element)
            return std::unexpected(element.error());
        if (!frame.contains(element->bounds)) {
            // A crop outside the frame could never be rendered as its own surface.
            auto code = element->crop ? Error::Code::SurfaceMismatch : Error::Code::MalformedInput;
            return std::unexpected(makeError(code,
                                             "element '" + element->id + "' bbox " + describeRect(element->bounds)
                                                 + " lies outside the " + std::to_string(frame.width) + "x"
                                                 + std::to_string(frame.height) + " frame"));
        }
        if (element->loadingIndicator) {
            if (sawLoadingPanel)
                return std::unexpected(malformed("more than one element is marked loading_indicator"));
            sawLoadingPanel = true;
        }
        auto key = element->key();
        if (catalog->index_.contains(key))
            return std::unexpected(malformed("duplicate layout element '" + key + "'"));
        catalog->index_.emplace(key, catalog->elements_.size());
        catalog->elements_.push_back(std::move(*element));
    }

    gs_log("Loaded layout '" + catalog->screenName_ + "' with " + std::to_string(catalog->elements_.size()) + " elements",
           "Layout");
    return std::shared_ptr<const LayoutCatalog>(std::move(catalog));
}

auto LayoutCatalog::find(std::string_view key) const -> LayoutElement const* {
    auto it = index_.find(std::string(key));
    if (it == index_.end())
        return nullptr;
    return &elements_[it->second];
}

auto LayoutCatalog::findIcon(IconGroup group, std::string_view id) const -> LayoutElement const* {
    std::string key{iconGroupToString(group)};
    key.push_back('/');
    key.append(id);
    return find(key);
}

auto LayoutCatalog::require(std::string_view key) const -> Expected<LayoutElement const*> {
    if (auto const* element = find(key))
        return element;
    return std::unexpected(
        makeError(Error::Code::ConfigurationError, "layout has no element '" + std::string(key) + "'"));
}

auto LayoutCatalog::icons(IconGroup group) const -> std::vector<LayoutElement const*> {
    std::vector<LayoutElement const*> result;
    for (auto const& element : elements_) {
        if (element.kind == ElementKind::Icon && element.group == group)
            result.push_back(&element);
    }
    return result;
}

auto LayoutCatalog::requiredIcons(IconGroup group) const -> std::vector<LayoutElement const*> {
    std::vector<LayoutElement const*> result;
    for (auto const* element : icons(group)) {
        if (element->required)
            result.push_back(element);
    }
    return result;
}

auto LayoutCatalog::optionalIcons(IconGroup group) const -> std::vector<LayoutElement const*> {
    std::vector<LayoutElement const*> result;
    for (auto const* element : icons(group)) {
        if (!element->required)
            result.push_back(element);
    }
    return result;
}

auto LayoutCatalog::regionFor(IconGroup group) const -> LayoutElement const* {
    for (auto const& element : elements_) {
        if (element.kind == ElementKind::Region && element.group == group)
            return &element;
    }
    return nullptr;
}

auto LayoutCatalog::loadingIndicator() const -> LayoutElement const* {
    for (auto const& element : elements_) {
        if (element.loadingIndicator)
            return &element;
    }
    return nullptr;
}

auto LayoutCatalog::datetimeArea() const -> LayoutElement const* {
    for (auto const& element : elements_) {
        if (element.kind == ElementKind::Text)
            return &element;
    }
    return nullptr;
}

auto LayoutCatalog::cropRegions() const -> std::vector<LayoutElement const*> {
    std::vector<LayoutElement const*> result;
    for (auto const& element : elements_) {
        if (element.crop)
            result.push_back(&element);
    }
    return result;
}

auto loadLayoutCatalog(std::filesystem::path const& path) -> Expected<std::shared_ptr<const LayoutCatalog>> {
    auto document = readJsonFile(path);
    if (!document)
        return std::unexpected(document.error());
    return LayoutCatalog::fromJson(*document);
}

} // namespace GS
