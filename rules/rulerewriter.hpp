#pragma once
#include "ruleset.hpp"

namespace kbann {

/**
 * @brief Towell's rewriting of consequents defined by several rules.
 *
 *   A :- B, C.          A  :- A4.     A4 :- B, C.
 *   A :- D, E.    ==>   A  :- A5.     A5 :- D, E.
 *
 * Each defining rule of a multiply-defined head gets a fresh intermediate
 * literal <head><counter>; the counter starts at the input rule count and
 * skips names already used by the rule set. Single-definition rules keep
 * their order and come first, the rewritten pairs follow.
 */
class RuleRewriter
{
public:
    static RuleSet rewrite(const RuleSet& rules);
};

} // namespace kbann
