#include "trainer.hpp"

#include <iomanip>
#include "../errors.hpp"

namespace kbann {

double Trainer::evaluate(ITrainableModel& model,
                         const std::vector<InputBlock>& inputs,
                         const cv::Mat& targets)
{
    cv::Mat out = model.forward(inputs, /*training=*/false);

    cv::Mat y;
    targets.convertTo(y, CV_64F);
    if (y.cols == 1 && out.cols > 1)
        y = cv::repeat(y, 1, out.cols);
    if (y.size() != out.size())
        throw ShapeMismatch(-1, "targets do not match model outputs");

    cv::Mat diff = out - y;
    return diff.total() ? cv::sum(diff.mul(diff))[0] / static_cast<double>(diff.total()) : 0.0;
}

double Trainer::fit(ITrainableModel& model,
                    const std::vector<InputBlock>& inputs,
                    const cv::Mat& targets) const
{
    if (config_.epochs == 0)
        return evaluate(model, inputs, targets);

    double loss = 0.0;
    for (int epoch = 0; epoch < config_.epochs; ++epoch)
    {
        loss = model.step(inputs, targets);

        const bool last = (epoch + 1 == config_.epochs);
        if (log_ && (epoch % config_.logEvery == 0 || last))
            *log_ << "Epoch " << epoch << ": Loss = "
                  << std::fixed << std::setprecision(9) << loss
                  << std::defaultfloat << '\n';
    }
    return loss;
}

} // namespace kbann
