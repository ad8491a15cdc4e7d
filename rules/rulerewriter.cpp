#include "rulerewriter.hpp"

#include <unordered_set>

namespace kbann {

RuleSet RuleRewriter::rewrite(const RuleSet& rules)
{
    const auto occurrences = countHeads(rules);

    /* every name in use, so generated literals never collide */
    std::unordered_set<std::string> used;
    for (const auto& rule : rules)
    {
        used.insert(rule.head().name());
        for (const auto& lit : rule.body())
            used.insert(lit.name());
    }

    RuleSet kept;
    RuleSet rewritten;
    std::size_t counter = rules.size();

    for (const auto& rule : rules)
    {
        if (occurrences.at(rule.head().name()) <= 1)
        {
            kept.push_back(rule);
            continue;
        }

        std::string fresh = rule.head().name() + std::to_string(counter++);
        while (used.count(fresh))
            fresh = rule.head().name() + std::to_string(counter++);
        used.insert(fresh);

        Literal intermediate(fresh);
        rewritten.emplace_back(rule.head(), std::vector<Literal>{intermediate});
        rewritten.emplace_back(intermediate, rule.body());
    }

    kept.insert(kept.end(), rewritten.begin(), rewritten.end());
    return kept;
}

} // namespace kbann
