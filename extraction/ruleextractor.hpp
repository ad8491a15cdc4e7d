#pragma once
#include <string>
#include <vector>
#include "../clustering/weightclustering.hpp"
#include "../network/knowledgenetwork.hpp"

namespace kbann {

/** One cluster of antecedents sharing a weight. */
struct ClusterTerm
{
    double    weight{0.0};  ///< shared (averaged) weight of the cluster
    UnitNames antecedents;  ///< members, in input-unit order
};

/**
 * @brief Weighted threshold rule read back from one network unit.
 *
 *   Head :- bias < w1 * nt(a, b) + w2 * nt(c)
 *
 * where nt(...) is the number of listed antecedents that are true.
 */
struct ExtractedRule
{
    std::string              head;
    double                   bias{0.0};
    std::vector<ClusterTerm> terms;
    std::size_t              layer{0};  ///< weight layer whose output is head

    /** "bias < w1 * nt(a,b) + w2 * nt(c)" */
    std::string condition() const;

    /** "Head :- " + condition() */
    std::string toString() const;

    /** Three-line pseudo-code: Head = 0 / if condition: / \tHead = 1 */
    std::string toCode() const;
};

/**
 * @brief Network to rule translation over clustered weights.
 */
class RuleExtractor
{
public:
    /**
     * @param net       Network whose weights went through WeightClustering.
     * @param clusters  Assignments returned by WeightClustering::eliminate.
     * @return          One rule per output unit of every layer, layer by layer.
     * @throws ShapeMismatch if the assignments do not cover the network.
     */
    static std::vector<ExtractedRule> extract(const KnowledgeNetwork& net,
                                              const ClusterAssignments& clusters);
};

} // namespace kbann
