#include "kbannmodel.hpp"

#include <cmath>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

KbannModel::KbannModel(const std::vector<cv::Mat>& weights,
                       const std::vector<cv::Mat>& biases,
                       const TrainingConfig& config,
                       bool fixWeights)
    : config_{config}
    , fixWeights_{fixWeights}
    , rng_{config.seed}
{
    if (weights.size() != biases.size() || weights.empty())
        throw ShapeMismatch(0, "model needs one bias vector per weight matrix");

    for (std::size_t k = 0; k < weights.size(); ++k)
    {
        cv::Mat w, b;
        weights[k].convertTo(w, CV_64F);
        biases[k].convertTo(b, CV_64F);
        if (b.rows != 1 || b.cols != w.cols)
            throw ShapeMismatch(static_cast<int>(k), "bias " + matShapeStr(b) +
                                " vs weights " + matShapeStr(w));

        /* small positive jitter on every trainable parameter */
        if (config_.initNoise > 0.0)
        {
            cv::Mat noise(w.size(), CV_64F);
            if (!fixWeights_)
            {
                rng_.fill(noise, cv::RNG::UNIFORM, 0.0, config_.initNoise);
                w += noise;
            }
            cv::Mat bnoise(b.size(), CV_64F);
            rng_.fill(bnoise, cv::RNG::UNIFORM, 0.0, config_.initNoise);
            b += bnoise;
        }

        w_.push_back(w);
        b_.push_back(b);
        mW_.push_back(cv::Mat::zeros(w.size(), CV_64F));
        vW_.push_back(cv::Mat::zeros(w.size(), CV_64F));
        mB_.push_back(cv::Mat::zeros(b.size(), CV_64F));
        vB_.push_back(cv::Mat::zeros(b.size(), CV_64F));
    }
}

cv::Mat KbannModel::sigmoid(const cv::Mat& z)
{
    cv::Mat negZ = -z;
    cv::Mat e;
    cv::exp(negZ, e);
    cv::Mat denom = e + 1.0;
    cv::Mat s;
    cv::divide(1.0, denom, s);
    return s;
}

KbannModel::Pass KbannModel::propagate(const std::vector<InputBlock>& inputs, bool training)
{
    const InputBlock* first = findBlock(inputs, 0);
    if (!first)
        throw ShapeMismatch(0, "no input block for the first layer");

    Pass pass;
    const double p = training ? config_.dropout : 0.0;

    for (std::size_t k = 0; k < w_.size(); ++k)
    {
        cv::Mat in;
        cv::Mat keep;

        if (k == 0)
        {
            in = first->data;
        }
        else
        {
            cv::Mat prev = pass.activations.back();
            if (p > 0.0)
            {
                // inverted dropout: kept units are scaled by 1 / (1 - p)
                cv::Mat u(prev.size(), CV_64F);
                rng_.fill(u, cv::RNG::UNIFORM, 0.0, 1.0);
                cv::Mat kept = u >= p;                      // CV_8U, 255 or 0
                kept.convertTo(keep, CV_64F, 1.0 / (255.0 * (1.0 - p)));

                // fresh buffer: the undropped activations are needed for backprop
                cv::Mat dropped;
                cv::multiply(prev, keep, dropped);
                prev = dropped;
            }

            const InputBlock* extra = findBlock(inputs, k);
            if (extra)
                cv::hconcat(prev, extra->data, in);
            else
                in = prev;
        }

        if (in.cols != w_[k].rows)
            throw ShapeMismatch(static_cast<int>(k), "input has " + std::to_string(in.cols) +
                                " columns, weights " + matShapeStr(w_[k]));

        cv::Mat z = in * w_[k] - cv::repeat(b_[k], in.rows, 1);

        pass.layerInputs.push_back(in);
        pass.activations.push_back(sigmoid(z));
        pass.keepMasks.push_back(keep);
    }
    return pass;
}

cv::Mat KbannModel::forward(const std::vector<InputBlock>& inputs, bool training)
{
    return propagate(inputs, training).activations.back();
}

void KbannModel::adamUpdate(cv::Mat& param, const cv::Mat& grad, cv::Mat& m, cv::Mat& v) const
{
    m = kBeta1 * m + (1.0 - kBeta1) * grad;
    v = kBeta2 * v + (1.0 - kBeta2) * grad.mul(grad);

    const double c1 = 1.0 - std::pow(kBeta1, t_);
    const double c2 = 1.0 - std::pow(kBeta2, t_);

    cv::Mat vHat = v / c2;
    cv::Mat denom;
    cv::sqrt(vHat, denom);
    denom += kEps;

    cv::Mat mHat = m / c1;
    cv::Mat update;
    cv::divide(mHat, denom, update);
    param -= config_.learningRate * update;
}

double KbannModel::step(const std::vector<InputBlock>& inputs, const cv::Mat& targets)
{
    Pass pass = propagate(inputs, /*training=*/true);
    const cv::Mat& out = pass.activations.back();

    cv::Mat y;
    targets.convertTo(y, CV_64F);
    if (y.rows != out.rows)
        throw ShapeMismatch(static_cast<int>(w_.size()) - 1,
                            std::to_string(y.rows) + " targets for " +
                            std::to_string(out.rows) + " examples");
    if (y.cols == 1 && out.cols > 1)
        y = cv::repeat(y, 1, out.cols);
    else if (y.cols != out.cols)
        throw ShapeMismatch(static_cast<int>(w_.size()) - 1,
                            "target columns " + std::to_string(y.cols) +
                            " vs outputs " + std::to_string(out.cols));

    cv::Mat diff = out - y;
    const double n    = static_cast<double>(diff.total());
    const double loss = cv::sum(diff.mul(diff))[0] / n;

    ++t_;
    cv::Mat grad = diff * (2.0 / n);            // dL/da of the last layer

    for (std::size_t i = w_.size(); i-- > 0;)
    {
        const cv::Mat& a = pass.activations[i];
        cv::Mat oneMinus = 1.0 - a;
        cv::Mat delta    = grad.mul(a.mul(oneMinus));

        cv::Mat gW = pass.layerInputs[i].t() * delta;
        cv::Mat gB;
        cv::reduce(delta, gB, 0, cv::REDUCE_SUM);
        gB = -gB;                               // z = in W - b

        if (i > 0)
        {
            // gradient w.r.t. the carried activations, before W changes
            cv::Mat gIn = delta * w_[i].t();
            const int carried = pass.activations[i - 1].cols;
            grad = gIn.colRange(0, carried).clone();
            if (!pass.keepMasks[i].empty())
                grad = grad.mul(pass.keepMasks[i]);
        }

        if (!fixWeights_)
            adamUpdate(w_[i], gW, mW_[i], vW_[i]);
        adamUpdate(b_[i], gB, mB_[i], vB_[i]);
    }
    return loss;
}

std::vector<cv::Mat> KbannModel::weights() const
{
    std::vector<cv::Mat> out;
    for (const auto& w : w_) out.push_back(w.clone());
    return out;
}

std::vector<cv::Mat> KbannModel::biases() const
{
    std::vector<cv::Mat> out;
    for (const auto& b : b_) out.push_back(b.clone());
    return out;
}

} // namespace kbann
