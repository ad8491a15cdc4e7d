#include "ruleextractor.hpp"

#include <algorithm>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

/* ===== ExtractedRule ====================================================== */
std::string ExtractedRule::condition() const
{
    std::string body;
    for (const auto& term : terms)
    {
        if (!body.empty())
            body += " + ";
        body += formatNumber(term.weight) + " * nt(";
        for (std::size_t i = 0; i < term.antecedents.size(); ++i)
        {
            if (i) body += ",";
            body += term.antecedents[i];
        }
        body += ")";
    }
    return formatNumber(bias) + " < " + body;
}

std::string ExtractedRule::toString() const
{
    return head + " :- " + condition();
}

std::string ExtractedRule::toCode() const
{
    return head + " = 0\n" +
           "if " + condition() + ":\n" +
           "\t" + head + " = 1";
}

/* ===== RuleExtractor ====================================================== */
std::vector<ExtractedRule> RuleExtractor::extract(const KnowledgeNetwork& net,
                                                  const ClusterAssignments& clusters)
{
    if (clusters.size() != net.depth())
        throw ShapeMismatch(static_cast<int>(std::min(clusters.size(), net.depth())),
                            "cluster assignments cover " + std::to_string(clusters.size()) +
                            " of " + std::to_string(net.depth()) + " layers");

    std::vector<ExtractedRule> rules;
    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        const cv::Mat&   w   = net.weights[k];
        const cv::Mat&   b   = net.biases[k];
        const UnitNames& in  = net.inputs(k);
        const UnitNames& out = net.outputs(k);

        if (clusters[k].size() != static_cast<std::size_t>(w.cols))
            throw ShapeMismatch(static_cast<int>(k), "one assignment per output unit expected");

        for (int j = 0; j < w.cols; ++j)
        {
            const ClusterAssignment& ids = clusters[k][j];
            if (ids.size() != static_cast<std::size_t>(w.rows))
                throw ShapeMismatch(static_cast<int>(k), "assignment of unit '" + out[j] +
                                    "' has " + std::to_string(ids.size()) + " entries");

            ExtractedRule rule;
            rule.head = out[j];
            rule.bias = b.at<double>(0, j);
            rule.layer = k;

            /* unique ids in order of first appearance */
            std::vector<int> order;
            for (int id : ids)
                if (std::find(order.begin(), order.end(), id) == order.end())
                    order.push_back(id);

            for (int id : order)
            {
                ClusterTerm term;
                bool first = true;
                for (int i = 0; i < w.rows; ++i)
                {
                    if (ids[i] != id) continue;
                    if (first)
                    {
                        term.weight = w.at<double>(i, j);
                        first = false;
                    }
                    term.antecedents.push_back(in[i]);
                }
                rule.terms.push_back(std::move(term));
            }
            rules.push_back(std::move(rule));
        }
    }
    return rules;
}

} // namespace kbann
