#include "emmixture.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace kbann {

EmMixtureEstimator::EmMixtureEstimator(int components, const ClusteringConfig& config)
    : components_{components}
    , em_{cv::ml::EM::create()}
{
    if (components < 1)
        throw std::invalid_argument("mixture needs at least one component");

    em_->setClustersNumber(components);
    em_->setCovarianceMatrixType(cv::ml::EM::COV_MAT_DIAGONAL);
    em_->setTermCriteria(cv::TermCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS,
                                          config.maxIterations, config.epsilon));
}

bool EmMixtureEstimator::fit(const cv::Mat& samples)
{
    CV_Assert(samples.cols == 1 && samples.type() == CV_64FC1);

    trained_ = false;
    if (samples.rows < components_)
        return false;

    try {
        trained_ = em_->trainEM(samples);
    }
    catch (const cv::Exception& e) {
        std::cerr << "EM fit with " << components_ << " components failed: "
                  << e.what() << std::endl;
        trained_ = false;
    }
    return trained_;
}

std::vector<int> EmMixtureEstimator::predict(const cv::Mat& samples) const
{
    if (!trained_)
        throw std::logic_error("EmMixtureEstimator::predict() before a successful fit()");

    std::vector<int> ids;
    ids.reserve(static_cast<std::size_t>(samples.rows));
    for (int i = 0; i < samples.rows; ++i)
    {
        const cv::Vec2d r = em_->predict2(samples.row(i), cv::noArray());
        ids.push_back(cvRound(r[1]));
    }
    return ids;
}

double EmMixtureEstimator::bic(const cv::Mat& samples) const
{
    if (!trained_)
        throw std::logic_error("EmMixtureEstimator::bic() before a successful fit()");

    double logLikelihood = 0.0;
    for (int i = 0; i < samples.rows; ++i)
        logLikelihood += em_->predict2(samples.row(i), cv::noArray())[0];

    const double params = 3.0 * components_ - 1.0;
    return -2.0 * logLikelihood + params * std::log(static_cast<double>(samples.rows));
}

MixtureFactory EmMixtureEstimator::factory(const ClusteringConfig& config)
{
    return [config](int components) -> std::unique_ptr<IMixtureEstimator> {
        return std::make_unique<EmMixtureEstimator>(components, config);
    };
}

} // namespace kbann
