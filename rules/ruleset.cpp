#include "ruleset.hpp"

#include <stdexcept>
#include <unordered_set>

namespace kbann {

/* ===== Rule =============================================================== */
Rule::Rule(Literal head, std::vector<Literal> body)
    : head_{std::move(head)}
    , body_{std::move(body)}
{
    if (head_.negated())
        throw std::invalid_argument("rule head '" + head_.name() + "' must not be negated");
}

std::string Rule::toString() const
{
    std::string out = head_.name() + " :- ";
    for (size_t i = 0; i < body_.size(); ++i)
    {
        if (i) out += ", ";
        out += body_[i].toString();
    }
    return out;
}

/* ===== helpers ============================================================ */
std::vector<std::string> antecedentNames(const RuleSet& rules)
{
    std::vector<std::string>        names;
    std::unordered_set<std::string> seen;
    for (const auto& rule : rules)
        for (const auto& lit : rule.body())
            if (seen.insert(lit.name()).second)
                names.push_back(lit.name());
    return names;
}

std::vector<std::string> consequentNames(const RuleSet& rules)
{
    std::vector<std::string>        names;
    std::unordered_set<std::string> seen;
    for (const auto& rule : rules)
        if (seen.insert(rule.head().name()).second)
            names.push_back(rule.head().name());
    return names;
}

std::unordered_map<std::string, int> countHeads(const RuleSet& rules)
{
    std::unordered_map<std::string, int> counts;
    for (const auto& rule : rules)
        ++counts[rule.head().name()];
    return counts;
}

} // namespace kbann
