#include "ruleparser.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

bool RuleParser::stripNegation(std::string& token)
{
    std::string t = trim(token);
    while (!t.empty() && t[0] == '-')           // the '-' of ":-"
        t = trim(t.substr(1));
    if (t.size() > 3 && t.compare(0, 3, "not") == 0 &&
        std::isspace(static_cast<unsigned char>(t[3])))
    {
        token = t.substr(4);
        return true;
    }
    return false;
}

Rule RuleParser::parseLine(const std::string& line, int lineNo)
{
    const auto colon = line.find(':');
    if (colon == std::string::npos)
        throw MalformedRuleLine(lineNo, line, "missing ':' between head and body");

    std::string headToken = line.substr(0, colon);
    if (stripNegation(headToken))
        throw MalformedRuleLine(lineNo, line, "negated head");

    const std::string headName = cleanse(headToken);
    if (headName.empty())
        throw MalformedRuleLine(lineNo, line, "empty head");

    std::vector<Literal> body;
    for (std::string token : split(line.substr(colon + 1), ','))
    {
        const bool negated = stripNegation(token);
        std::string name   = cleanse(token);
        if (name.empty())
            throw MalformedRuleLine(lineNo, line, "empty body literal");
        body.emplace_back(std::move(name), negated);
    }
    if (body.empty())
        throw MalformedRuleLine(lineNo, line, "empty body");

    return Rule(Literal(headName), std::move(body));
}

RuleSet RuleParser::parse(std::istream& in)
{
    RuleSet rules;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        if (trim(line).empty())
            continue;
        rules.push_back(parseLine(line, lineNo));
    }
    return rules;
}

RuleSet RuleParser::loadFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Could not open rule file: " + path);
    return parse(file);
}

} // namespace kbann
