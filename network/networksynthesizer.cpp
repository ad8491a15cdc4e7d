#include "networksynthesizer.hpp"

#include <unordered_map>
#include "../utils.hpp"

namespace kbann {

std::vector<UnitNames> NetworkSynthesizer::carriedUnits(const std::vector<RuleSet>& ruleLayers)
{
    std::unordered_map<std::string, std::size_t> producedAt;
    for (std::size_t k = 0; k < ruleLayers.size(); ++k)
        for (const auto& head : consequentNames(ruleLayers[k]))
            producedAt[head] = k;

    std::vector<UnitNames> carry(ruleLayers.size());
    for (std::size_t k = 0; k < ruleLayers.size(); ++k)
    {
        for (const auto& name : antecedentNames(ruleLayers[k]))
        {
            auto it = producedAt.find(name);
            if (it == producedAt.end() || it->second + 1 >= k)
                continue;                       // raw feature, or produced right below

            for (std::size_t m = it->second + 1; m < k; ++m)
                if (indexOf(carry[m], name) < 0)
                    carry[m].push_back(name);
        }
    }
    return carry;
}

KnowledgeNetwork NetworkSynthesizer::synthesize(const std::vector<RuleSet>& ruleLayers) const
{
    const double omega = config_.omega;
    const auto   carry = carriedUnits(ruleLayers);

    KnowledgeNetwork net;
    UnitNames lastLayer;

    for (std::size_t k = 0; k < ruleLayers.size(); ++k)
    {
        const RuleSet& rules = ruleLayers[k];

        /* inputs: everything the previous layer produced, then new antecedents */
        UnitNames in = lastLayer;
        for (const auto& name : antecedentNames(rules))
            if (indexOf(in, name) < 0)
                in.push_back(name);

        UnitNames out = consequentNames(rules);
        out.insert(out.end(), carry[k].begin(), carry[k].end());

        /* a head defined by several rules in this layer is a disjunction */
        const auto occurrences = countHeads(rules);

        cv::Mat1d w = cv::Mat1d::zeros(static_cast<int>(in.size()), static_cast<int>(out.size()));
        cv::Mat1d b = cv::Mat1d::zeros(1, static_cast<int>(out.size()));

        for (const auto& rule : rules)
        {
            const int j = indexOf(out, rule.head().name());
            for (const auto& lit : rule.body())
            {
                const int i = indexOf(in, lit.name());
                w(i, j) = lit.negated() ? -omega : omega;
            }

            if (occurrences.at(rule.head().name()) > 1)
                b(0, j) = 0.5 * omega;
            else
                b(0, j) = (static_cast<double>(rule.body().size()) - 0.5) * omega;
        }

        for (const auto& name : carry[k])
        {
            const int i = indexOf(in, name);
            const int j = indexOf(out, name);
            w(i, j) = omega;
            b(0, j) = 0.5 * omega;
        }

        net.layers.push_back(in);
        net.layers.push_back(out);
        net.weights.push_back(w);
        net.biases.push_back(b);
        lastLayer = out;
    }

    net.validate();
    return net;
}

} // namespace kbann
