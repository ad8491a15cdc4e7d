#pragma once
#include <string>
#include <vector>
#include "knowledgenetwork.hpp"
#include "../config.hpp"

namespace kbann {

/**
 * @brief Adds capacity the domain theory did not provide.
 *
 * Both operations work in place, start every new link at zero so the
 * network still computes the rules before training, and validate the
 * result.
 */
class NetworkAugmenter
{
public:
    explicit NetworkAugmenter(const AugmentConfig& config) : config_(config) {}

    /**
     * @brief Append features no rule refers to as inputs of layer 0.
     *
     * @param net           Network to widen.
     * @param featureNames  All dataset feature names.
     * @param selection     Candidate features; empty means all of featureNames.
     * @return              Names actually added, in candidate order.
     * @throws UnknownFeatureReference if a candidate is not a dataset feature.
     */
    UnitNames addInputUnits(KnowledgeNetwork& net,
                            const UnitNames& featureNames,
                            const UnitNames& selection = {}) const;

    /**
     * @brief Insert rule-free hidden units after weight layer
     *        config.hiddenAfterLayer.
     *
     * @return Names of the new units.
     * @throws ShapeMismatch if that layer has no successor.
     */
    UnitNames addHiddenUnits(KnowledgeNetwork& net) const;

private:
    AugmentConfig config_;
};

} // namespace kbann
