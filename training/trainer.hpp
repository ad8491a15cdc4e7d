#pragma once
#include <ostream>
#include <vector>
#include "trainablemodel.h"
#include "../config.hpp"

namespace kbann {

/**
 * @brief Full-batch training loop for any ITrainableModel.
 */
class Trainer
{
public:
    explicit Trainer(const TrainingConfig& config, std::ostream* log = nullptr)
        : config_(config), log_(log) {}

    /**
     * Run config.epochs steps.
     * @return loss of the last step, or of a plain forward pass when epochs == 0.
     */
    double fit(ITrainableModel& model,
               const std::vector<InputBlock>& inputs,
               const cv::Mat& targets) const;

    /** Mean squared error of the model in inference mode. */
    static double evaluate(ITrainableModel& model,
                           const std::vector<InputBlock>& inputs,
                           const cv::Mat& targets);

private:
    TrainingConfig config_;
    std::ostream*  log_;
};

} // namespace kbann
