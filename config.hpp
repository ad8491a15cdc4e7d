#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace kbann {

    /** Rule to network translation. */
    struct SynthesisConfig {
        double omega = 4.0; ///< magnitude of a rule link weight
    };

    /** Structural augmentation of the synthesized network. */
    struct AugmentConfig {
        bool addInputUnits = true;              ///< append features not referenced by rules
        std::vector<std::string> inputFeatures; ///< candidate features; empty = all dataset features
        int hiddenUnits = 3;                    ///< number of rule-free hidden units
        std::string hiddenPrefix = "head";      ///< names are prefix + 1..N
        int hiddenAfterLayer = 0;               ///< weight layer whose outputs are widened
    };

    /** Alignment of raw dataset columns with network inputs. */
    struct AlignConfig {
        double noiseScale = 1e-5; ///< uniform noise added to hidden-layer inputs
        std::uint64_t seed = 7;   ///< RNG seed for that noise
    };

    /**
     * Gradient training of the synthesized network. The translation engine
     * never reads these; they drive the trainer only.
     */
    struct TrainingConfig {
        int epochs = 2000;          ///< optimization steps per pass
        double learningRate = 0.1;  ///< Adam step size
        double dropout = 0.1;       ///< unit dropout probability on hidden inputs
        double initNoise = 0.1;     ///< uniform noise added to trainable parameters
        int logEvery = 100;         ///< loss print interval, in epochs
        std::uint64_t seed = 42;    ///< RNG seed for noise and dropout
    };

    /** Mixture fitting used for weight clustering. */
    struct ClusteringConfig {
        int maxIterations = 100; ///< EM iteration cap
        double epsilon = 1e-6;   ///< EM log-likelihood tolerance
    };

    /** Files written by the driver. Empty path = not written. */
    struct OutputConfig {
        std::string rulesFile = "refined_rules.txt"; ///< extracted rules
        std::string dotFile;                         ///< Graphviz view of the trained network
        std::string heatmapPrefix;                   ///< per-layer weight heat map PNGs
    };

    /** Combined configuration for the full refinement pipeline. */
    struct KbannConfig {
        SynthesisConfig  synthesisConfig;  ///< rule -> network
        AugmentConfig    augmentConfig;    ///< extra inputs and hidden units
        AlignConfig      alignConfig;      ///< data alignment
        TrainingConfig   trainingConfig;   ///< both training passes
        ClusteringConfig clusteringConfig; ///< weight clustering
        OutputConfig     outputConfig;     ///< driver outputs
    };

    /**
     * @brief Fill a configuration from a parsed YAML document.
     *
     * Missing sections and keys keep their defaults.
     * @throws std::runtime_error on out-of-range values.
     */
    KbannConfig loadConfig(const YAML::Node& root);

    /** Load and validate a YAML configuration file. */
    KbannConfig loadConfigFile(const std::string& path);

    /** Throw std::runtime_error if a value is out of range. */
    void validateConfig(const KbannConfig& config);

} // namespace kbann
