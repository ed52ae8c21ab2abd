#include "groundsynth/GroundSynth.hpp"

#include "layout/LayoutCatalog.hpp"
#include "log/TaggedLogger.hpp"
#include "render/SceneRenderer.hpp"
#include "task/TaskRegistry.hpp"

namespace GS {

auto generate(DatasetConfig const& config) -> Expected<Dataset> {
    if (config.layout.empty())
        return std::unexpected(makeError(Error::Code::ConfigurationError, "config names no layout document"));
    auto catalog = loadLayoutCatalog(config.layout);
    if (!catalog)
        return std::unexpected(catalog.error());
    auto registry = makeDefaultRegistry(*catalog, config.tasks);
    if (!registry)
        return std::unexpected(registry.error());

    SchematicRenderer renderer(**catalog);
    DatasetAssembler  assembler(config, *catalog, renderer, *registry);
    return assembler.assemble();
}

auto verify(std::filesystem::path const& datasetRoot) -> Expected<LeakageReport> {
    return verifyDatasetAt(datasetRoot);
}

auto preprocess(std::filesystem::path const& datasetRoot, std::size_t workers) -> PipelineResult {
    return preprocessDatasetAt(datasetRoot, workers);
}

} // namespace GS
