#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include "yaml-cpp/yaml.h"

#include "config.hpp"
#include "utils.hpp"
#include "kbann_pipeline.hpp"
#include "visualization.hpp"
#include "data/dataset.hpp"
#include "extraction/ruleevaluator.h"
#include "extraction/rulewriter.h"
#include "network/network_dot.hpp"
#include "rules/ruleparser.h"

using namespace kbann;

int main(int argc, char** argv)
{
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <dataset.txt> <rules.txt> [config.yaml]" << std::endl;
        return 1;
    }

    const std::string dataFile  = argv[1];
    const std::string rulesFile = argv[2];
    // A config given on the command line must load; otherwise "default.yml" if present
    const bool explicitConfig     = argc >= 4;
    const std::string configFile  = explicitConfig ? argv[3] : "default.yml";

    try {
        KbannConfig config;
        if (explicitConfig || std::filesystem::exists(configFile)) {
            config = loadConfigFile(configFile);
            std::cout << "Loaded config from: " << configFile << std::endl;
        } else {
            std::cout << "Config file not found (" << configFile << "); using defaults." << std::endl;
        }

        Dataset data = Dataset::load(dataFile);
        std::cout << "Loaded dataset: " << dataFile << " (" << data.size() << " examples, "
                  << data.featureNames.size() << " features)" << std::endl;

        RuleSet rules = RuleParser::loadFile(rulesFile);
        std::cout << "Loaded rules: " << rulesFile << " (" << rules.size() << " rules)" << std::endl;

        KbannPipeline pipeline(config, {}, &std::cout);
        PipelineResult result = pipeline.run(rules, data);

        std::cout << "Final loss: " << result.freeLoss
                  << " (free), " << result.biasLoss << " (bias only)" << std::endl;

        std::cout << "Layers:" << std::endl;
        for (const auto& names : result.network.layers)
            std::cout << "  " << listStr(names) << std::endl;

        std::cout << "Refined rules:" << std::endl;
        for (const auto& r : result.rules)
            std::cout << r.toCode() << "\n" << std::endl;

        // compiled before anything is written: a name clash fails the run cleanly
        RuleEvaluator evaluator(result.rules);

        /* ---------- outputs ---------------------------------------------- */
        const OutputConfig& out = config.outputConfig;
        if (!out.rulesFile.empty()) {
            saveRules(result.rules, out.rulesFile);
            std::cout << "Rules written to " << out.rulesFile << std::endl;
        }
        if (!out.dotFile.empty()) {
            std::ofstream dot(out.dotFile);
            if (!dot)
                throw std::runtime_error("cannot open '" + out.dotFile + "' for writing");
            writeDot(result.network, dot);
            std::cout << "Network written to " << out.dotFile << std::endl;
        }
        if (!out.heatmapPrefix.empty()) {
            for (const auto& path : writeWeightHeatmaps(result.network, out.heatmapPrefix))
                std::cout << "Heat map written to " << path << std::endl;
        }

        /* ---------- how well do the refined rules fit the data? ---------- */
        const auto& finalUnits = result.network.layers.back();
        for (const auto& unit : finalUnits)
            std::cout << "Accuracy of " << unit << ": "
                      << evaluator.accuracy(data, unit) << std::endl;
    } catch (const YAML::Exception& e) {
        std::cerr << "Failed to load config file: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
