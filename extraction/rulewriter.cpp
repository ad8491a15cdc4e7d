#include "rulewriter.h"

#include <fstream>
#include <stdexcept>

namespace kbann {

std::string quoteRule(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text)
    {
        if (c == '\\' || c == '\'')
            out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

void writeRules(const std::vector<ExtractedRule>& rules, std::ostream& out)
{
    for (const auto& r : rules)
        out << quoteRule(r.toString()) << '\n';
}

void saveRules(const std::vector<ExtractedRule>& rules, const std::string& path)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file)
        throw std::runtime_error("cannot open '" + path + "' for writing");

    writeRules(rules, file);

    file.flush();
    if (!file)
        throw std::runtime_error("failed writing rules to '" + path + "'");
}

} // namespace kbann
