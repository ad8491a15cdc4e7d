#include "networkaugmenter.hpp"

#include <unordered_set>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

UnitNames NetworkAugmenter::addInputUnits(KnowledgeNetwork& net,
                                          const UnitNames& featureNames,
                                          const UnitNames& selection) const
{
    if (net.depth() == 0)
        throw ShapeMismatch(0, "cannot add inputs to an empty network");

    const UnitNames& candidates = selection.empty() ? featureNames : selection;

    const auto present = net.allUnits();
    std::unordered_set<std::string> taken(present.begin(), present.end());

    UnitNames added;
    for (const auto& name : candidates)
    {
        if (indexOf(featureNames, name) < 0)
            throw UnknownFeatureReference(name, 0);
        if (taken.insert(name).second)
            added.push_back(name);
    }

    cv::Mat& w = net.weights[0];
    w = insertZeroRows(w, w.rows, static_cast<int>(added.size()));
    net.layers[0].insert(net.layers[0].end(), added.begin(), added.end());

    net.validate();
    return added;
}

UnitNames NetworkAugmenter::addHiddenUnits(KnowledgeNetwork& net) const
{
    const std::size_t k = static_cast<std::size_t>(config_.hiddenAfterLayer);
    if (k + 1 >= net.depth())
        throw ShapeMismatch(static_cast<int>(k),
                            "hidden units need a following layer, network has " +
                            std::to_string(net.depth()));

    /* head1, head2, ... skipping numbers another unit already uses */
    const auto present = net.allUnits();
    std::unordered_set<std::string> taken(present.begin(), present.end());

    UnitNames added;
    for (int n = 1; static_cast<int>(added.size()) < config_.hiddenUnits; ++n)
    {
        std::string name = config_.hiddenPrefix + std::to_string(n);
        if (taken.insert(name).second)
            added.push_back(name);
    }

    const int count = static_cast<int>(added.size());
    const int at    = static_cast<int>(net.outputs(k).size()); // end of the carried block

    net.weights[k]     = appendZeroCols(net.weights[k], count);
    net.biases[k]      = appendZeroCols(net.biases[k], count);
    net.weights[k + 1] = insertZeroRows(net.weights[k + 1], at, count);

    UnitNames& out  = net.layers[2 * k + 1];
    UnitNames& next = net.layers[2 * k + 2];
    out.insert(out.end(), added.begin(), added.end());
    next.insert(next.begin() + at, added.begin(), added.end());

    net.validate();
    return added;
}

} // namespace kbann
