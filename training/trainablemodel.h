#ifndef KBANN_TRAINABLEMODEL_H
#define KBANN_TRAINABLEMODEL_H

#include <vector>
#include <opencv2/core.hpp>
#include "../data/dataaligner.hpp"

namespace kbann {

/**
 * @brief Abstract interface for a differentiable model built from a
 *        KnowledgeNetwork's parameters.
 */
class ITrainableModel
{
public:
    virtual ~ITrainableModel() = default;

    /** Output activations, rows = examples. Dropout only when training. */
    virtual cv::Mat forward(const std::vector<InputBlock>& inputs, bool training) = 0;

    /** One optimization step on the full batch; returns the loss before it. */
    virtual double step(const std::vector<InputBlock>& inputs, const cv::Mat& targets) = 0;

    /** Current parameters, copied out. */
    virtual std::vector<cv::Mat> weights() const = 0;
    virtual std::vector<cv::Mat> biases()  const = 0;
};

} // namespace kbann

#endif // KBANN_TRAINABLEMODEL_H
