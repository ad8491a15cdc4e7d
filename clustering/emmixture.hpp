#ifndef KBANN_EMMIXTURE_H
#define KBANN_EMMIXTURE_H

#include <opencv2/ml.hpp>
#include "mixtureestimator.h"
#include "../config.hpp"

namespace kbann {

/**
 * @brief IMixtureEstimator backed by OpenCV's expectation-maximization.
 *
 * BIC = -2 * sum(log p(x)) + (3k - 1) * ln(n): k means, k variances and
 * k - 1 free mixing weights.
 */
class EmMixtureEstimator final : public IMixtureEstimator
{
public:
    EmMixtureEstimator(int components, const ClusteringConfig& config);

    bool             fit(const cv::Mat& samples) override;
    std::vector<int> predict(const cv::Mat& samples) const override;
    double           bic(const cv::Mat& samples) const override;
    int              components() const noexcept override { return components_; }

    /** Factory for WeightClustering. */
    static MixtureFactory factory(const ClusteringConfig& config);

private:
    int                  components_;
    cv::Ptr<cv::ml::EM>  em_;
    bool                 trained_{false};
};

} // namespace kbann

#endif // KBANN_EMMIXTURE_H
