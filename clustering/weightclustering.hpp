#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include "mixtureestimator.h"
#include "../network/knowledgenetwork.hpp"

namespace kbann {

/** Cluster id per incoming weight of one unit. */
using ClusterAssignment = std::vector<int>;

/** [weight layer][output unit] -> assignment */
using ClusterAssignments = std::vector<std::vector<ClusterAssignment>>;

/**
 * @brief Replaces each unit's incoming weights by a few shared values.
 *
 * Mixtures with 2 .. n-1 components are fitted to the n weights of a unit;
 * the lowest BIC wins, and every weight becomes the mean of its component.
 * Two weights form two singleton clusters, a single weight one cluster.
 */
class WeightClustering
{
public:
    explicit WeightClustering(MixtureFactory factory) : factory_(std::move(factory)) {}

    /**
     * @brief Cluster one column of weights in place.
     *
     * @param column  n x 1 CV_64F, overwritten with cluster means.
     * @return        Cluster id per entry.
     * @throws DegenerateClusterInput if column is empty or no mixture fits.
     */
    ClusterAssignment clusterColumn(cv::Mat& column) const;

    /** Cluster every column of every weight matrix of net in place. */
    ClusterAssignments eliminate(KnowledgeNetwork& net) const;

private:
    MixtureFactory factory_;
};

} // namespace kbann
