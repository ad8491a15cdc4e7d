#include "config.hpp"

#include <stdexcept>
#include "yaml-cpp/yaml.h"

namespace kbann {

// Read key into out when present; otherwise keep the default.
template<typename T>
static void readKey(const YAML::Node& node, const char* key, T& out)
{
    if (node && node[key])
        out = node[key].as<T>();
}

KbannConfig loadConfig(const YAML::Node& root)
{
    KbannConfig cfg;

    if (auto n = root["synthesis"])
        readKey(n, "omega", cfg.synthesisConfig.omega);

    if (auto n = root["augment"])
    {
        auto& a = cfg.augmentConfig;
        readKey(n, "add_input_units", a.addInputUnits);
        readKey(n, "input_features", a.inputFeatures);
        readKey(n, "hidden_units", a.hiddenUnits);
        readKey(n, "hidden_prefix", a.hiddenPrefix);
        readKey(n, "hidden_after_layer", a.hiddenAfterLayer);
    }

    if (auto n = root["align"])
    {
        readKey(n, "noise_scale", cfg.alignConfig.noiseScale);
        readKey(n, "seed", cfg.alignConfig.seed);
    }

    if (auto n = root["training"])
    {
        auto& t = cfg.trainingConfig;
        readKey(n, "epochs", t.epochs);
        readKey(n, "learning_rate", t.learningRate);
        readKey(n, "dropout", t.dropout);
        readKey(n, "init_noise", t.initNoise);
        readKey(n, "log_every", t.logEvery);
        readKey(n, "seed", t.seed);
    }

    if (auto n = root["clustering"])
    {
        readKey(n, "max_iterations", cfg.clusteringConfig.maxIterations);
        readKey(n, "epsilon", cfg.clusteringConfig.epsilon);
    }

    if (auto n = root["output"])
    {
        readKey(n, "rules_file", cfg.outputConfig.rulesFile);
        readKey(n, "dot_file", cfg.outputConfig.dotFile);
        readKey(n, "heatmap_prefix", cfg.outputConfig.heatmapPrefix);
    }

    validateConfig(cfg);
    return cfg;
}

KbannConfig loadConfigFile(const std::string& path)
{
    YAML::Node root = YAML::LoadFile(path);
    return loadConfig(root);
}

void validateConfig(const KbannConfig& c)
{
    auto fail = [](const std::string& what) {
        throw std::runtime_error("config: " + what);
    };

    if (!(c.synthesisConfig.omega > 0.0))
        fail("synthesis.omega must be positive");
    if (c.augmentConfig.hiddenUnits < 0)
        fail("augment.hidden_units must not be negative");
    if (c.augmentConfig.hiddenAfterLayer < 0)
        fail("augment.hidden_after_layer must not be negative");
    if (c.augmentConfig.hiddenUnits > 0 && c.augmentConfig.hiddenPrefix.empty())
        fail("augment.hidden_prefix must not be empty");
    if (c.alignConfig.noiseScale < 0.0)
        fail("align.noise_scale must not be negative");
    if (c.trainingConfig.epochs < 0)
        fail("training.epochs must not be negative");
    if (!(c.trainingConfig.learningRate > 0.0))
        fail("training.learning_rate must be positive");
    if (c.trainingConfig.dropout < 0.0 || c.trainingConfig.dropout >= 1.0)
        fail("training.dropout must be in [0, 1)");
    if (c.trainingConfig.initNoise < 0.0)
        fail("training.init_noise must not be negative");
    if (c.trainingConfig.logEvery <= 0)
        fail("training.log_every must be positive");
    if (c.clusteringConfig.maxIterations <= 0)
        fail("clustering.max_iterations must be positive");
    if (!(c.clusteringConfig.epsilon > 0.0))
        fail("clustering.epsilon must be positive");
}

} // namespace kbann
