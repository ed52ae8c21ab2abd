#include "groundsynth/GroundSynth.hpp"
#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {

using GS::Cli::CommandLine;

void print_usage() {
    std::cout << "Usage: groundsynth_cli <command> [options]\n"
                 "Commands:\n"
                 "  generate --config <file> [--output <dir>] [--seed <n>] [--scale <f>]\n"
                 "      Generate a dataset. --scale multiplies every scene count (at least 1 per kind).\n"
                 "  verify <dataset_dir> [--report <file>]\n"
                 "      Check that no disjointness key is shared by train/val and test.\n"
                 "      Writes <dataset_dir>/verify_report.json unless --report names another file.\n"
                 "  preprocess <dataset_dir> [--workers <n>]\n"
                 "      Re-encode every sample image under <dataset_dir>/preprocessed.\n"
                 "Options:\n"
                 "  --help                     Show this message\n";
}

auto report_error(GS::Error const& error) -> int {
    std::cerr << "groundsynth_cli: " << GS::describeError(error) << "\n";
    return 1;
}

struct GenerateOptions {
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> output;
    std::optional<std::uint64_t>         seed;
    std::optional<double>                scale;
};

auto run_generate(int argc, char** argv) -> int {
    GenerateOptions options;
    bool            help = false;

    CommandLine cli;
    cli.set_program_name("groundsynth_cli generate");
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_value("--config", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      options.config = std::filesystem::path(value);
                      return std::nullopt;
                  }});
    cli.add_value("--output", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      options.output = std::filesystem::path(value);
                      return std::nullopt;
                  }});
    cli.add_int("--seed", {.on_value = [&](long long value) -> CommandLine::ParseError {
                    if (value < 0)
                        return std::string{"--seed must be non-negative"};
                    options.seed = static_cast<std::uint64_t>(value);
                    return std::nullopt;
                }});
    cli.add_double("--scale", {.on_value = [&](double value) -> CommandLine::ParseError {
                       if (!(value > 0.0))
                           return std::string{"--scale must be positive"};
                       options.scale = value;
                       return std::nullopt;
                   }});
    cli.add_alias("-c", "--config");
    cli.add_alias("-o", "--output");
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv, 2))
        return 1;
    if (help) {
        print_usage();
        return 0;
    }
    if (!options.config) {
        std::cerr << "groundsynth_cli generate: --config is required\n";
        return 1;
    }

    auto config = GS::loadDatasetConfig(*options.config);
    if (!config)
        return report_error(config.error());
    if (options.output)
        config->outputDir = *options.output;
    if (options.seed)
        config->seed = *options.seed;
    if (options.scale)
        *config = config->scaled(*options.scale);

    auto dataset = GS::generate(*config);
    if (!dataset)
        return report_error(dataset.error());

    std::cout << "Wrote " << dataset->countSplit(GS::Split::Train) << " train, "
              << dataset->countSplit(GS::Split::Val) << " val and " << dataset->testSamples.size()
              << " test samples to " << dataset->root.string() << "\n";
    return 0;
}

auto run_verify(int argc, char** argv) -> int {
    std::optional<std::filesystem::path> reportPath;
    bool                                 help = false;

    CommandLine cli;
    cli.set_program_name("groundsynth_cli verify");
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_value("--report", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      reportPath = std::filesystem::path(value);
                      return std::nullopt;
                  }});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv, 2))
        return 1;
    if (help) {
        print_usage();
        return 0;
    }
    if (cli.positionals().size() != 1) {
        std::cerr << "groundsynth_cli verify: expected exactly one dataset directory\n";
        return 1;
    }
    std::filesystem::path root(cli.positionals().front());

    auto report = GS::verify(root);
    if (!report)
        return report_error(report.error());
    if (auto written = GS::writeReport(*report, reportPath.value_or(root / GS::kVerifyReportFile)); !written)
        return report_error(written.error());

    std::cout << report->toJson().dump(2) << "\n";
    if (auto clean = GS::requireNoLeakage(*report); !clean)
        return report_error(clean.error());
    return 0;
}

auto run_preprocess(int argc, char** argv) -> int {
    std::size_t workers = std::max(1u, std::thread::hardware_concurrency());
    bool        help    = false;

    CommandLine cli;
    cli.set_program_name("groundsynth_cli preprocess");
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_int("--workers", {.on_value = [&](long long value) -> CommandLine::ParseError {
                    if (value < 1)
                        return std::string{"--workers must be at least 1"};
                    workers = static_cast<std::size_t>(value);
                    return std::nullopt;
                }});
    cli.add_alias("-j", "--workers");
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv, 2))
        return 1;
    if (help) {
        print_usage();
        return 0;
    }
    if (cli.positionals().size() != 1) {
        std::cerr << "groundsynth_cli preprocess: expected exactly one dataset directory\n";
        return 1;
    }

    auto manifest = GS::preprocess(std::filesystem::path(cli.positionals().front()), workers);
    if (!manifest) {
        std::cerr << "groundsynth_cli: preprocessing failed\n" << manifest.error().describe() << "\n";
        return 1;
    }
    std::cout << "Preprocessed " << manifest->trainSamples << " train, " << manifest->valSamples << " val and "
              << manifest->testSamples << " test samples\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
#ifdef GS_LOG_DEBUG
    GS::set_thread_name("Main");
#endif
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string_view command{argv[1]};
    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }
    if (command == "generate")
        return run_generate(argc, argv);
    if (command == "verify")
        return run_verify(argc, argv);
    if (command == "preprocess")
        return run_preprocess(argc, argv);

    std::cerr << "groundsynth_cli: unknown command '" << command << "'\n";
    print_usage();
    return 1;
}
