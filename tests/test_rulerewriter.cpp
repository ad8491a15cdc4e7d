#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>

#include "rules/ruleparser.h"
#include "rules/rulerewriter.hpp"

using namespace kbann;

static RuleSet parse(const std::string& text)
{
    std::istringstream in(text);
    return RuleParser::parse(in);
}

TEST(RuleRewriter, SingleDefinitionsAreUnchanged)
{
    RuleSet rules = parse("A :- B, C.\nD :- not A.\nE :- D.\n");
    EXPECT_EQ(RuleRewriter::rewrite(rules), rules);
}

TEST(RuleRewriter, SplitsMultiplyDefinedHeads)
{
    RuleSet rules = parse("A :- B, C.\nA :- D, E.\nF :- G.\n");
    RuleSet out   = RuleRewriter::rewrite(rules);

    // counter starts at the input rule count (3)
    RuleSet expected = parse("F :- G.\n"
                             "A :- A3.\nA3 :- B, C.\n"
                             "A :- A4.\nA4 :- D, E.\n");
    EXPECT_EQ(out, expected);
}

TEST(RuleRewriter, ProducesKIntermediatesAnd2KRules)
{
    RuleSet rules = parse("H :- a.\nH :- b, not c.\nH :- d.\n");
    RuleSet out   = RuleRewriter::rewrite(rules);
    ASSERT_EQ(out.size(), 6u);

    std::vector<std::string> intermediates;
    for (const auto& r : out)
        if (r.head().name() == "H")
        {
            ASSERT_EQ(r.body().size(), 1u);
            intermediates.push_back(r.body()[0].name());
        }
    ASSERT_EQ(intermediates.size(), 3u);

    // every original body survives verbatim under its intermediate
    for (std::size_t i = 0; i < rules.size(); ++i)
    {
        auto it = std::find_if(out.begin(), out.end(), [&](const Rule& r) {
            return r.head().name() == intermediates[i];
        });
        ASSERT_NE(it, out.end());
        EXPECT_EQ(it->body(), rules[i].body());
    }
}

TEST(RuleRewriter, FreshNamesSkipExistingLiterals)
{
    // "H2" is already a feature name
    RuleSet out = RuleRewriter::rewrite(parse("H :- H2.\nH :- b.\n"));
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].body()[0].name(), "H3");
    EXPECT_EQ(out[2].body()[0].name(), "H4");
}
