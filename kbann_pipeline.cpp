#include "kbann_pipeline.hpp"

#include "clustering/emmixture.hpp"
#include "data/dataaligner.hpp"
#include "errors.hpp"
#include "network/networkaugmenter.hpp"
#include "network/networksynthesizer.hpp"
#include "rules/rulelayering.hpp"
#include "rules/rulerewriter.hpp"
#include "training/kbannmodel.hpp"
#include "training/trainer.hpp"
#include "utils.hpp"

namespace kbann {

KbannPipeline::KbannPipeline(KbannConfig config, MixtureFactory factory, std::ostream* log)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , log_(log)
{
    validateConfig(config_);
    if (!factory_)
        factory_ = EmMixtureEstimator::factory(config_.clusteringConfig);
}

KnowledgeNetwork KbannPipeline::compile(const RuleSet& rules) const
{
    const RuleSet rewritten = RuleRewriter::rewrite(rules);
    const std::vector<RuleSet> ruleLayers = RuleLayering::layer(rewritten);
    return NetworkSynthesizer(config_.synthesisConfig).synthesize(ruleLayers);
}

void KbannPipeline::logLayers(const char* title, const KnowledgeNetwork& net) const
{
    if (!log_)
        return;
    *log_ << title << ":" << std::endl;
    for (std::size_t k = 0; k < net.depth(); ++k)
        *log_ << "  layer " << k << ": " << listStr(net.inputs(k))
              << " -> " << listStr(net.outputs(k))
              << "  W " << matShapeStr(net.weights[k]) << std::endl;
}

PipelineResult KbannPipeline::run(const RuleSet& rules, const Dataset& data) const
{
    if (data.size() == 0)
        throw KbannError("dataset has no examples");

    PipelineResult result;

    /* ---------- 1. rules -> network ---------------------------------- */
    KnowledgeNetwork net = compile(rules);
    logLayers("Synthesized network", net);

    /* ---------- 2. augmentation -------------------------------------- */
    const AugmentConfig& aug = config_.augmentConfig;
    NetworkAugmenter augmenter(aug);
    if (aug.addInputUnits)
    {
        result.addedInputs = augmenter.addInputUnits(net, data.featureNames, aug.inputFeatures);
        if (log_)
            *log_ << "Added input units: " << listStr(result.addedInputs) << std::endl;
    }
    if (aug.hiddenUnits > 0)
    {
        if (static_cast<std::size_t>(aug.hiddenAfterLayer) + 1 < net.depth())
        {
            result.hiddenUnits = augmenter.addHiddenUnits(net);
            if (log_)
                *log_ << "Added hidden units: " << listStr(result.hiddenUnits) << std::endl;
        }
        else if (log_)
        {
            *log_ << "No layer after layer " << aug.hiddenAfterLayer
                  << "; hidden units not added" << std::endl;
        }
    }
    logLayers("Augmented network", net);

    /* ---------- 3. data ---------------------------------------------- */
    const std::vector<InputBlock> blocks = DataAligner(config_.alignConfig).align(data, net);
    const cv::Mat targets = data.targets();

    Trainer trainer(config_.trainingConfig, log_);

    /* ---------- 4. free training ------------------------------------- */
    if (log_) *log_ << "Training all parameters" << std::endl;
    KbannModel freeModel(net.weights, net.biases, config_.trainingConfig);
    result.freeLoss = trainer.fit(freeModel, blocks, targets);
    net.weights = freeModel.weights();
    net.biases  = freeModel.biases();

    /* ---------- 5. clustering ---------------------------------------- */
    result.clusters = WeightClustering(factory_).eliminate(net);

    /* ---------- 6. bias-only training on clustered weights ----------- */
    if (log_) *log_ << "Training biases on clustered weights" << std::endl;
    KbannModel biasModel(net.weights, net.biases, config_.trainingConfig, true);
    result.biasLoss = trainer.fit(biasModel, blocks, targets);
    net.biases = biasModel.biases();
    net.validate();

    /* ---------- 7. extraction ---------------------------------------- */
    result.rules   = RuleExtractor::extract(net, result.clusters);
    result.network = std::move(net);
    return result;
}

} // namespace kbann
