#include "weightclustering.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include "../errors.hpp"

namespace kbann {

ClusterAssignment WeightClustering::clusterColumn(cv::Mat& column) const
{
    const int n = column.rows;
    if (n < 1 || column.empty())
        throw DegenerateClusterInput("no weights to cluster");
    CV_Assert(column.cols == 1 && column.type() == CV_64FC1);
    if (n == 1)
        return {0};
    if (n == 2)
        return {0, 1};                          // a 2-point mixture is not well posed

    /* identical weights need no model; no k may exceed the distinct values */
    std::vector<double> distinct(column.begin<double>(), column.end<double>());
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (distinct.size() == 1)
        return ClusterAssignment(static_cast<std::size_t>(n), 0);
    const int maxComponents = std::min(n - 1, static_cast<int>(distinct.size()));

    /* model selection over the number of components */
    std::unique_ptr<IMixtureEstimator> best;
    double lowestBic = std::numeric_limits<double>::infinity();

    for (int k = 2; k <= maxComponents; ++k)
    {
        auto gmm = factory_(k);
        if (!gmm->fit(column))
        {
            std::cerr << "mixture with " << k << " components did not fit; skipped" << std::endl;
            continue;
        }
        const double score = gmm->bic(column);
        if (!std::isfinite(score))
        {
            std::cerr << "mixture with " << k << " components has no finite BIC; skipped" << std::endl;
            continue;
        }
        if (!best || score < lowestBic)
        {
            lowestBic = score;
            best = std::move(gmm);
        }
    }
    if (!best)
        throw DegenerateClusterInput("no mixture could be fitted to " +
                                     std::to_string(n) + " weights");

    ClusterAssignment ids = best->predict(column);
    CV_Assert(static_cast<int>(ids.size()) == n);

    /* every member of a cluster takes the cluster mean */
    std::map<int, std::pair<double, int>> sums;   // id -> (sum, count)
    for (int i = 0; i < n; ++i)
    {
        auto& s = sums[ids[i]];
        s.first += column.at<double>(i, 0);
        ++s.second;
    }
    for (int i = 0; i < n; ++i)
    {
        const auto& s = sums[ids[i]];
        column.at<double>(i, 0) = s.first / s.second;
    }
    return ids;
}

ClusterAssignments WeightClustering::eliminate(KnowledgeNetwork& net) const
{
    ClusterAssignments all;
    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        cv::Mat& w = net.weights[k];
        std::vector<ClusterAssignment> layer;
        for (int j = 0; j < w.cols; ++j)
        {
            cv::Mat column = w.col(j).clone();
            layer.push_back(clusterColumn(column));
            column.copyTo(w.col(j));
        }
        all.push_back(std::move(layer));
    }
    return all;
}

} // namespace kbann
