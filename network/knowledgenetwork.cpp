#include "knowledgenetwork.hpp"

#include <algorithm>
#include <unordered_set>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

UnitNames KnowledgeNetwork::allUnits() const
{
    UnitNames names;
    std::unordered_set<std::string> seen;
    for (const auto& layer : layers)
        for (const auto& unit : layer)
            if (seen.insert(unit).second)
                names.push_back(unit);
    return names;
}

UnitNames KnowledgeNetwork::freshInputs(std::size_t k) const
{
    if (k == 0)
        return inputs(0);

    const UnitNames& carried = outputs(k - 1);
    const UnitNames& in      = inputs(k);
    if (in.size() <= carried.size())
        return {};
    return UnitNames(in.begin() + static_cast<std::ptrdiff_t>(carried.size()), in.end());
}

void KnowledgeNetwork::validate() const
{
    if (biases.size() != weights.size())
        throw ShapeMismatch(static_cast<int>(std::min(biases.size(), weights.size())),
                            "bias vector count differs from weight matrix count");
    if (layers.size() != 2 * weights.size())
        throw ShapeMismatch(static_cast<int>(layers.size() / 2),
                            "unit-name layer count is not twice the weight layer count");

    for (std::size_t k = 0; k < weights.size(); ++k)
    {
        const int layer  = static_cast<int>(k);
        const cv::Mat& w = weights[k];
        const cv::Mat& b = biases[k];

        if (w.type() != CV_64FC1 || b.type() != CV_64FC1)
            throw ShapeMismatch(layer, "expected CV_64FC1, got weights " + matShapeStr(w) +
                                       ", bias " + matShapeStr(b));
        if (w.rows != static_cast<int>(inputs(k).size()))
            throw ShapeMismatch(layer, "weights " + matShapeStr(w) + " vs " +
                                       std::to_string(inputs(k).size()) + " input units");
        if (w.cols != static_cast<int>(outputs(k).size()))
            throw ShapeMismatch(layer, "weights " + matShapeStr(w) + " vs " +
                                       std::to_string(outputs(k).size()) + " output units");
        if (b.rows != 1 || b.cols != w.cols)
            throw ShapeMismatch(layer, "bias " + matShapeStr(b) + " vs weights " + matShapeStr(w));

        if (k > 0)
        {
            const UnitNames& carried = outputs(k - 1);
            const UnitNames& in      = inputs(k);
            if (in.size() < carried.size() ||
                !std::equal(carried.begin(), carried.end(), in.begin()))
                throw ShapeMismatch(layer, "input units do not start with the outputs of layer " +
                                           std::to_string(k - 1));
        }
    }
}

KnowledgeNetwork KnowledgeNetwork::clone() const
{
    KnowledgeNetwork copy;
    copy.layers = layers;
    for (const auto& w : weights) copy.weights.push_back(w.clone());
    for (const auto& b : biases)  copy.biases.push_back(b.clone());
    return copy;
}

} // namespace kbann
