#ifndef KBANN_RULEPARSER_H
#define KBANN_RULEPARSER_H

#include <istream>
#include <string>
#include "ruleset.hpp"

namespace kbann {

/**
 * @brief Reader for the line-oriented rule file format.
 *
 * One rule per line:  Head : Body1, not Body2, ...
 * Whitespace, hyphens and periods are dropped from names, so "A :- B, C."
 * reads the same as "A : B, C". Blank lines are skipped.
 */
class RuleParser
{
public:
    /** Parse one rule. @throws MalformedRuleLine */
    static Rule parseLine(const std::string& line, int lineNo = 0);

    /** Parse every rule of a stream. */
    static RuleSet parse(std::istream& in);

    /** Parse a rule file. @throws std::runtime_error if it cannot be opened. */
    static RuleSet loadFile(const std::string& path);

private:
    /** Split off a leading "not" token; returns true when negated. */
    static bool stripNegation(std::string& token);
};

} // namespace kbann

#endif // KBANN_RULEPARSER_H
