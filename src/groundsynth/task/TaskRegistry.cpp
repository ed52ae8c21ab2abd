#include "task/TaskRegistry.hpp"

#include "log/TaggedLogger.hpp"
#include "task/IconTasks.hpp"
#include "task/WaitLoadingTask.hpp"

namespace GS {

auto TaskRegistry::add(std::unique_ptr<TaskGenerator> generator) -> Expected<void> {
    if (!generator)
        return std::unexpected(makeError(Error::Code::InvalidArgument, "null task generator"));
    std::string kind(generator->kind());
    if (generators_.contains(kind))
        return std::unexpected(makeError(Error::Code::InvalidArgument, "task kind '" + kind + "' registered twice"));
    gs_log("Registered task kind " + kind, "Task", "INFO");
    generators_.emplace(std::move(kind), std::move(generator));
    return {};
}

auto TaskRegistry::find(std::string_view kind) const -> TaskGenerator const* {
    auto it = generators_.find(kind);
    return it == generators_.end() ? nullptr : it->second.get();
}

auto TaskRegistry::kinds() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(generators_.size());
    for (auto const& [kind, _] : generators_)
        result.push_back(kind);
    return result;
}

auto makeDefaultRegistry(std::shared_ptr<const LayoutCatalog> catalog, TaskOptions const& options)
    -> Expected<TaskRegistry> {
    if (!catalog)
        return std::unexpected(makeError(Error::Code::InvalidArgument, "registry needs a layout catalog"));

    TaskRegistry registry;
    std::unique_ptr<TaskGenerator> generators[] = {
        std::make_unique<IconClickTask>(catalog, IconGroup::Desktop, options),
        std::make_unique<IconClickTask>(catalog, IconGroup::Taskbar, options),
        std::make_unique<IconListTask>(catalog, options),
        std::make_unique<WaitLoadingTask>(catalog, options),
    };
    for (auto& generator : generators) {
        if (auto added = registry.add(std::move(generator)); !added)
            return std::unexpected(added.error());
    }
    return registry;
}

} // namespace GS
