#pragma once
#include <vector>
#include "knowledgenetwork.hpp"
#include "../rules/ruleset.hpp"
#include "../config.hpp"

namespace kbann {

/**
 * @brief Towell's mapping of layered rules onto network parameters.
 *
 * A rule H :- l1..lp becomes links of weight +omega (or -omega for a negated
 * literal) from each li to H. The bias of H is the threshold that makes the
 * untrained unit compute the rule:
 *   conjunctive H (one defining rule)   (p - 0.5) * omega
 *   disjunctive H (several rules)       0.5 * omega
 * A derived literal used more than one layer above its producer is carried
 * through the layers in between by a same-name unit with one +omega link and
 * bias 0.5 * omega.
 */
class NetworkSynthesizer
{
public:
    explicit NetworkSynthesizer(const SynthesisConfig& config) : config_(config) {}

    /**
     * @param ruleLayers  Output of RuleLayering::layer.
     * @return            Validated network, one weight layer per rule layer.
     */
    KnowledgeNetwork synthesize(const std::vector<RuleSet>& ruleLayers) const;

private:
    /** Per rule layer, the derived literals that must be carried through it. */
    static std::vector<UnitNames> carriedUnits(const std::vector<RuleSet>& ruleLayers);

    SynthesisConfig config_;
};

} // namespace kbann
