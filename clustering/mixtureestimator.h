#ifndef KBANN_MIXTUREESTIMATOR_H
#define KBANN_MIXTUREESTIMATOR_H

#include <functional>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

namespace kbann {

/**
 * @brief 1-D Gaussian mixture with a fixed number of components.
 *
 * Samples are n x 1 CV_64F column matrices.
 */
class IMixtureEstimator
{
public:
    virtual ~IMixtureEstimator() = default;

    /** Fit the mixture; false if the fit did not converge to a usable model. */
    virtual bool fit(const cv::Mat& samples) = 0;

    /** Most probable component per sample. */
    virtual std::vector<int> predict(const cv::Mat& samples) const = 0;

    /** Bayesian information criterion of the fitted model on samples. */
    virtual double bic(const cv::Mat& samples) const = 0;

    virtual int components() const noexcept = 0;
};

/** Creates an estimator with the requested number of components. */
using MixtureFactory = std::function<std::unique_ptr<IMixtureEstimator>(int components)>;

} // namespace kbann

#endif // KBANN_MIXTUREESTIMATOR_H
