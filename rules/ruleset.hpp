#pragma once
/*-----------------------------------------------------------------------------
 *  ruleset.hpp
 *
 *  Propositional domain theory: literals, Horn-like rules with negated
 *  antecedents, and helpers that flatten a rule set into unit names.
 *---------------------------------------------------------------------------*/
#include <string>
#include <vector>
#include <unordered_map>

namespace kbann {

/* ---------- literal ------------------------------------------------------- */
/**
 * @brief Named atomic proposition, optionally negated. Immutable.
 */
class Literal
{
public:
    explicit Literal(std::string name, bool negated = false)
        : name_{std::move(name)}, negated_{negated} {}

    const std::string& name()    const noexcept { return name_; }
    bool               negated() const noexcept { return negated_; }

    bool operator==(const Literal& o) const noexcept
    { return negated_ == o.negated_ && name_ == o.name_; }
    bool operator!=(const Literal& o) const noexcept { return !(*this == o); }

    /** "A" or "not A" */
    std::string toString() const { return negated_ ? "not " + name_ : name_; }

private:
    std::string name_;
    bool        negated_{false};
};

/* ---------- rule ---------------------------------------------------------- */
/**
 * @brief Implication from a conjunction of body literals to one head.
 *
 * The head is never negated.
 */
class Rule
{
public:
    /** @throws std::invalid_argument if the head is negated. */
    Rule(Literal head, std::vector<Literal> body);

    const Literal&              head() const noexcept { return head_; }
    const std::vector<Literal>& body() const noexcept { return body_; }

    bool operator==(const Rule& o) const noexcept
    { return head_ == o.head_ && body_ == o.body_; }
    bool operator!=(const Rule& o) const noexcept { return !(*this == o); }

    /** "H :- A, not B" */
    std::string toString() const;

private:
    Literal              head_;
    std::vector<Literal> body_;
};

using RuleSet = std::vector<Rule>;

/* ---------- helpers ------------------------------------------------------- */

/** Distinct body literal names, in order of first appearance. */
std::vector<std::string> antecedentNames(const RuleSet& rules);

/** Distinct head names, in order of first appearance. */
std::vector<std::string> consequentNames(const RuleSet& rules);

/** Number of defining rules per head name. */
std::unordered_map<std::string, int> countHeads(const RuleSet& rules);

} // namespace kbann
