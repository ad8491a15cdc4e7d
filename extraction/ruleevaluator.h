#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <exprtk.hpp>
#include "ruleextractor.hpp"
#include "../data/dataset.hpp"

namespace kbann {

/**
 * @brief Runs extracted rules as compiled expressions.
 *
 * Every rule condition is compiled once with ExprTk against a shared symbol
 * table holding one variable per unit name; nt(...) counts the arguments
 * above 0.5. Rules run layer by layer: every rule of a layer reads the
 * values the layer below produced, and the layer's heads are committed
 * together afterwards. A carried unit keeps its input's name, so within one
 * layer a rule never sees a sibling's fresh value.
 *
 * ExprTk symbol names are case-insensitive; units differing only in case
 * (A and a) are rejected by the constructor.
 */
class RuleEvaluator
{
    /** nt(a, b, ...): number of true arguments. */
    struct NumberTrue final : public exprtk::ivararg_function<double>
    {
        double operator()(const std::vector<double>& args) override;
    };

    struct CompiledRule
    {
        std::string                head;  ///< unit the rule sets
        std::size_t                layer; ///< weight layer of head
        double*                    value; ///< its variable
        exprtk::expression<double> expr;  ///< compiled condition
    };

public:
    /**
     * @throws std::runtime_error if a rule does not compile or two unit
     *         names collide in the symbol table.
     */
    explicit RuleEvaluator(const std::vector<ExtractedRule>& rules);

    RuleEvaluator(const RuleEvaluator&)            = delete;
    RuleEvaluator& operator=(const RuleEvaluator&) = delete;

    /**
     * @brief Evaluate all rules for one example.
     * @param facts  Values of input units; unknown names are ignored.
     * @return       Value (0 or 1 for heads) of every unit.
     */
    std::unordered_map<std::string, double>
    evaluate(const std::unordered_map<std::string, double>& facts);

    /**
     * @brief Share of examples where unit agrees with the label.
     * A label >= 0.5 counts as true.
     */
    double accuracy(const Dataset& data, const std::string& unit);

private:
    double* addVar(const std::string& name);

    //------------------------------------------------------------------
    // Data members (storage first: expressions point into it)
    std::unordered_map<std::string, double> var_pool_; ///< backing storage for variables
    NumberTrue                              nt_;
    exprtk::symbol_table<double>            syms_;
    exprtk::parser<double>                  parser_;
    std::vector<CompiledRule>               rules_;    ///< sorted by layer
    std::vector<double>                     staged_;   ///< one layer's results before commit
};

} // namespace kbann
