#pragma once

#include "core/Error.hpp"
#include "layout/LayoutCatalog.hpp"
#include "task/TaskGenerator.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace GS {

// Generators by kind string; kinds() is sorted, which fixes the generation order of a run.
class TaskRegistry {
public:
    auto add(std::unique_ptr<TaskGenerator> generator) -> Expected<void>;

    [[nodiscard]] auto find(std::string_view kind) const -> TaskGenerator const*;
    [[nodiscard]] auto contains(std::string_view kind) const -> bool { return find(kind) != nullptr; }
    [[nodiscard]] auto kinds() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return generators_.size(); }

private:
    std::map<std::string, std::unique_ptr<TaskGenerator>, std::less<>> generators_;
};

inline constexpr std::string_view kClickDesktopIconKind = "click-desktop-icon";
inline constexpr std::string_view kClickTaskbarIconKind = "click-taskbar-icon";
inline constexpr std::string_view kIconListKind         = "iconlist";
inline constexpr std::string_view kWaitLoadingKind      = "wait-loading";

// Registry with the four built-in generators bound to `catalog`.
[[nodiscard]] auto makeDefaultRegistry(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions const& options)
    -> Expected<TaskRegistry>;

} // namespace GS
