#include "rulelayering.hpp"

#include <algorithm>
#include <unordered_set>
#include "../errors.hpp"

namespace kbann {

std::vector<RuleSet> RuleLayering::layer(const RuleSet& rules)
{
    std::vector<RuleSet> layers;
    RuleSet remaining = rules;

    while (!remaining.empty())
    {
        const auto names = antecedentNames(remaining);
        const std::unordered_set<std::string> referenced(names.begin(), names.end());

        RuleSet frontier;
        RuleSet rest;
        for (const auto& rule : remaining)
        {
            if (referenced.count(rule.head().name()))
                rest.push_back(rule);
            else
                frontier.push_back(rule);
        }

        if (frontier.empty())
            throw CyclicRuleDependency(consequentNames(rest));

        layers.push_back(std::move(frontier));
        remaining = std::move(rest);
    }

    std::reverse(layers.begin(), layers.end());
    return layers;
}

} // namespace kbann
