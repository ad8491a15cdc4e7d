#ifndef KBANN_PIPELINE_HPP
#define KBANN_PIPELINE_HPP

#include <ostream>
#include <vector>

#include "config.hpp"
#include "clustering/mixtureestimator.h"
#include "clustering/weightclustering.hpp"
#include "data/dataset.hpp"
#include "extraction/ruleextractor.hpp"
#include "network/knowledgenetwork.hpp"
#include "rules/ruleset.hpp"

namespace kbann {

/**
 * @brief Everything a refinement run produces.
 */
struct PipelineResult
{
    KnowledgeNetwork           network;     ///< clustered weights, second-pass biases
    ClusterAssignments         clusters;    ///< per layer, per output unit
    std::vector<ExtractedRule> rules;       ///< refined rules, layer by layer
    UnitNames                  addedInputs; ///< features appended to layer 0
    UnitNames                  hiddenUnits; ///< rule-free units inserted
    double                     freeLoss{0.0}; ///< MSE after training all parameters
    double                     biasLoss{0.0}; ///< MSE after the bias-only pass
};

/**
 * @brief Rules -> network -> training -> clustering -> rules.
 */
class KbannPipeline
{
public:
    /**
     * @param config   Settings of every stage.
     * @param factory  Mixture estimator used for weight clustering;
     *                 defaults to EmMixtureEstimator.
     * @param log      Progress stream; nullptr silences the run.
     */
    explicit KbannPipeline(KbannConfig config,
                           MixtureFactory factory = {},
                           std::ostream* log = nullptr);

    /** Rewrite, layer and synthesize a rule set into an untrained network. */
    KnowledgeNetwork compile(const RuleSet& rules) const;

    /**
     * @brief Full refinement run.
     * @throws KbannError (any subclass) when a stage fails.
     */
    PipelineResult run(const RuleSet& rules, const Dataset& data) const;

    const KbannConfig& config() const noexcept { return config_; }

private:
    void logLayers(const char* title, const KnowledgeNetwork& net) const;

    KbannConfig    config_;
    MixtureFactory factory_;
    std::ostream*  log_;
};

} // namespace kbann

#endif // KBANN_PIPELINE_HPP
