//=============================================================================
// tmappa - treemap node attributes
//
// Reads an already laid-out tree, resolves the colour and bounds of every
// node and writes the result as YAML.
//=============================================================================

#include <tmappa/canvas.h>
#include <tmappa/config.h>
#include <tmappa/node-writer.h>
#include <tmappa/tree-builder.h>
#include <tmappa/tree.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <cmath>
#include <fstream>
#include <iostream>
#include <string>

using namespace tmappa;

static Result<void> run(const std::string& inputPath, const std::string& outputPath,
                        const Config& config) {
    Canvas::Options options;
    options.mutation = config.mutation();
    options.seed = config.seed();

    auto canvasResult = Canvas::create(options);
    if (!canvasResult) {
        return Err("Failed to create canvas", canvasResult);
    }
    auto canvas = *canvasResult;

    auto tree = loadTree(inputPath);
    if (!tree) {
        return Err("Failed to load tree", tree);
    }

    BuildOptions buildOptions;
    buildOptions.rootHue = config.rootHue();
    if (!std::isfinite(buildOptions.rootHue)) {
        return Err("root hue must be a finite number");
    }
    auto nodes = buildNodes(*tree, *canvas, buildOptions);
    spdlog::info("Resolved {} nodes (seed {})", nodes.size(), canvas->seed());

    std::string yaml = writeNodes(nodes, canvas->extent());
    if (outputPath.empty() || outputPath == "-") {
        std::cout << yaml << "\n";
        return Ok();
    }

    std::ofstream out(outputPath);
    if (!out.is_open()) {
        return Err("Cannot open output file: " + outputPath);
    }
    out << yaml << "\n";
    if (!out) {
        return Err("Failed to write output file: " + outputPath);
    }
    return Ok();
}

int main(int argc, const char** argv) {
    args::ArgumentParser parser("tmappa", "Resolve treemap node colours and bounds.");
    parser.Prog("tmappa");

    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "file",
        "Config file (default: $XDG_CONFIG_HOME/tmappa/config.yaml)", {'c', "config"});
    args::ValueFlag<float> mutationFlag(parser, "m",
        "Colour mutation magnitude, 0..1", {'m', "mutation"});
    args::ValueFlag<uint32_t> seedFlag(parser, "n",
        "Random seed for reproducible colours", {'s', "seed"});
    args::ValueFlag<float> hueFlag(parser, "h",
        "Hue of the root colour family, 0..1", {"hue"});
    args::ValueFlag<std::string> outputFlag(parser, "file",
        "Output file (default: stdout)", {'o', "output"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> inputArg(parser, "input", "Laid-out tree (YAML)");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    if (!inputArg) {
        std::cerr << "tmappa: missing input file\n";
        std::cerr << parser;
        return 1;
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (mutationFlag) overrides["colour"]["mutation"] = args::get(mutationFlag);
    if (hueFlag) overrides["colour"]["root-hue"] = args::get(hueFlag);
    if (seedFlag) overrides["random"]["seed"] = args::get(seedFlag);
    if (verboseFlag) overrides["log"]["level"] = "debug";

    auto configResult = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configResult) {
        spdlog::error("{}", error_msg(configResult));
        return 1;
    }
    auto config = *configResult;

    spdlog::set_level(spdlog::level::from_str(config->logLevel()));
    spdlog::cfg::load_env_levels();

    if (auto res = run(args::get(inputArg), outputFlag ? args::get(outputFlag) : "", *config); !res) {
        spdlog::error("{}", error_msg(res));
        return 1;
    }
    return 0;
}
