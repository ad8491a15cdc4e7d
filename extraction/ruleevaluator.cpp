#include "ruleevaluator.h"

#include <algorithm>
#include <stdexcept>

namespace kbann {

double RuleEvaluator::NumberTrue::operator()(const std::vector<double>& args)
{
    return static_cast<double>(std::count_if(args.begin(), args.end(),
                                             [](double v){ return v > 0.5; }));
}

RuleEvaluator::RuleEvaluator(const std::vector<ExtractedRule>& rules)
{
    if (!syms_.add_function("nt", nt_))
        throw std::runtime_error("RuleEvaluator: cannot register nt()");

    // ❶ one variable per unit, heads and antecedents alike
    for (const auto& rule : rules)
    {
        addVar(rule.head);
        for (const auto& term : rule.terms)
            for (const auto& name : term.antecedents)
                addVar(name);
    }

    // ❷ compile every condition against the shared table
    rules_.reserve(rules.size());
    for (const auto& rule : rules)
    {
        CompiledRule r;
        r.head  = rule.head;
        r.layer = rule.layer;
        r.value = &var_pool_.at(rule.head);
        r.expr.register_symbol_table(syms_);

        const std::string text = rule.condition();
        if (!parser_.compile(text, r.expr))
            throw std::runtime_error("ExprTk error in rule '" + rule.toString() +
                                     "': " + parser_.error());
        rules_.push_back(std::move(r));
    }
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const CompiledRule& a, const CompiledRule& b)
                     { return a.layer < b.layer; });
}

double* RuleEvaluator::addVar(const std::string& name)
{
    auto it = var_pool_.find(name);
    if (it != var_pool_.end())
        return &it->second;

    double& slot = var_pool_[name];             // zero-initialised
    if (!syms_.add_variable(name, slot))
        throw std::runtime_error("RuleEvaluator: unit name '" + name +
                                 "' is not a usable expression variable");
    return &slot;
}

std::unordered_map<std::string, double>
RuleEvaluator::evaluate(const std::unordered_map<std::string, double>& facts)
{
    /* results of the previous example must not leak into this one */
    for (auto& kv : var_pool_)
        kv.second = 0.0;

    for (const auto& kv : facts)
    {
        auto it = var_pool_.find(kv.first);
        if (it != var_pool_.end())
            it->second = kv.second;
    }

    // a layer reads only the layer below; commit its heads together
    for (std::size_t first = 0; first < rules_.size();)
    {
        std::size_t last = first;
        while (last < rules_.size() && rules_[last].layer == rules_[first].layer)
            ++last;

        staged_.clear();
        for (std::size_t i = first; i < last; ++i)
            staged_.push_back(rules_[i].expr.value() > 0.5 ? 1.0 : 0.0);
        for (std::size_t i = first; i < last; ++i)
            *rules_[i].value = staged_[i - first];

        first = last;
    }

    return var_pool_;
}

double RuleEvaluator::accuracy(const Dataset& data, const std::string& unit)
{
    if (data.size() == 0)
        return 0.0;

    const cv::Mat y = data.targets();
    int hits = 0;
    for (int r = 0; r < data.size(); ++r)
    {
        std::unordered_map<std::string, double> facts;
        for (std::size_t c = 0; c < data.featureNames.size(); ++c)
            facts[data.featureNames[c]] = data.features(r, static_cast<int>(c));

        const auto values = evaluate(facts);
        auto it = values.find(unit);
        if (it == values.end())
            throw std::runtime_error("RuleEvaluator: no rule or input named '" + unit + "'");

        const bool predicted = it->second > 0.5;
        const bool actual    = y.at<double>(r, 0) >= 0.5;
        if (predicted == actual)
            ++hits;
    }
    return static_cast<double>(hits) / data.size();
}

} // namespace kbann
