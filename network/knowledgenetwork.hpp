#pragma once
/*-----------------------------------------------------------------------------
 *  knowledgenetwork.hpp
 *
 *  Weights, biases and unit names of a rule-derived feed-forward network.
 *---------------------------------------------------------------------------*/
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace kbann {

using UnitNames = std::vector<std::string>;

/**
 * @brief Layered network translated from a domain theory.
 *
 * For weight layer k:
 *   weights[k]  CV_64F, rows = layers[2k].size(), cols = layers[2k+1].size()
 *   biases[k]   CV_64F, 1 x layers[2k+1].size()
 * and for k >= 1 the input names layers[2k] begin with the output names
 * layers[2k-1] (activations carried from the previous layer), followed by
 * units fed from raw data.
 */
struct KnowledgeNetwork
{
    std::vector<cv::Mat> weights;  ///< one matrix per weight layer
    std::vector<cv::Mat> biases;   ///< one row vector per weight layer
    std::vector<UnitNames> layers; ///< [in0, out0, in1, out1, ...]

    /** Number of weight layers. */
    [[nodiscard]] std::size_t depth() const noexcept { return weights.size(); }

    /** Input unit names of weight layer k. */
    const UnitNames& inputs(std::size_t k)  const { return layers.at(2 * k); }
    /** Output unit names of weight layer k. */
    const UnitNames& outputs(std::size_t k) const { return layers.at(2 * k + 1); }

    /** Every unit name of the stack, without repetitions. */
    UnitNames allUnits() const;

    /** Input units of layer k that are not carried over from layer k-1. */
    UnitNames freshInputs(std::size_t k) const;

    /**
     * @brief Check that weights, biases and names agree.
     * @throws ShapeMismatch naming the first offending layer.
     */
    void validate() const;

    /** Deep copy, so training one copy leaves the other intact. */
    KnowledgeNetwork clone() const;
};

} // namespace kbann
