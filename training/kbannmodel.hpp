#ifndef KBANN_KBANNMODEL_H
#define KBANN_KBANNMODEL_H

#include <vector>
#include <opencv2/core.hpp>
#include "trainablemodel.h"
#include "../config.hpp"

namespace kbann {

/**
 * @brief Sigmoid feed-forward network with multi-entry inputs.
 *
 *   a0 = sigmoid(X0 W0 - b0)
 *   ak = sigmoid([drop(a(k-1)), Xk] Wk - bk)      k >= 1
 *
 * Xk is the aligned raw-data block of layer k when there is one. Trained on
 * mean squared error with Adam. With fixWeights only the biases move.
 */
class KbannModel final : public ITrainableModel
{
public:
    KbannModel(const std::vector<cv::Mat>& weights,
               const std::vector<cv::Mat>& biases,
               const TrainingConfig& config,
               bool fixWeights = false);

    cv::Mat forward(const std::vector<InputBlock>& inputs, bool training) override;
    double  step(const std::vector<InputBlock>& inputs, const cv::Mat& targets) override;

    std::vector<cv::Mat> weights() const override;
    std::vector<cv::Mat> biases()  const override;

    bool fixedWeights() const noexcept { return fixWeights_; }

private:
    /** Everything backpropagation needs from one forward pass. */
    struct Pass
    {
        std::vector<cv::Mat> layerInputs; ///< input of each layer, after dropout
        std::vector<cv::Mat> activations; ///< output of each layer
        std::vector<cv::Mat> keepMasks;   ///< scaled dropout masks, empty if none
    };

    Pass propagate(const std::vector<InputBlock>& inputs, bool training);

    void adamUpdate(cv::Mat& param, const cv::Mat& grad, cv::Mat& m, cv::Mat& v) const;

    static cv::Mat sigmoid(const cv::Mat& z);

    std::vector<cv::Mat> w_;
    std::vector<cv::Mat> b_;
    std::vector<cv::Mat> mW_, vW_, mB_, vB_; ///< Adam moments

    TrainingConfig config_;
    bool           fixWeights_{false};
    cv::RNG        rng_;
    int            t_{0};                    ///< Adam step counter

    static constexpr double kBeta1 = 0.9;
    static constexpr double kBeta2 = 0.999;
    static constexpr double kEps   = 1e-8;
};

} // namespace kbann

#endif // KBANN_KBANNMODEL_H
