#pragma once
#include <vector>
#include "ruleset.hpp"

namespace kbann {

/**
 * @brief Topological layering of a rewritten rule set.
 *
 * Peels off, output side first, the rules whose heads no remaining rule
 * uses as an antecedent, then reverses the stack so that layer 0 reads the
 * raw inputs and the last layer produces the final conclusions.
 */
class RuleLayering
{
public:
    /**
     * @param rules  Rewritten rule set (acyclic).
     * @return       Rule layers in input-to-output order; every rule appears
     *               in exactly one layer.
     * @throws CyclicRuleDependency when no head can be peeled off.
     */
    static std::vector<RuleSet> layer(const RuleSet& rules);
};

} // namespace kbann
