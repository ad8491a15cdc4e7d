#include <gtest/gtest.h>
#include <sstream>

#include "data/dataaligner.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include "training/kbannmodel.hpp"
#include "training/trainer.hpp"

using namespace kbann;
using kbann::testing::compileRules;
using kbann::testing::datasetFrom;

namespace {

TrainingConfig quietConfig()
{
    TrainingConfig cfg;
    cfg.initNoise = 0.0;
    cfg.dropout   = 0.0;
    cfg.epochs    = 300;
    return cfg;
}

const char* kTruthTable = "A,B,y\n0,0,0\n0,1,1\n1,0,1\n1,1,1\n";   // A or B

} // namespace

TEST(KbannModel, ForwardComputesRulesBeforeTraining)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);

    KbannModel model(net.weights, net.biases, quietConfig());
    cv::Mat out = model.forward(blocks, false);
    ASSERT_EQ(out.size(), cv::Size(1, 4));
    EXPECT_LT(out.at<double>(0, 0), 0.5);
    EXPECT_LT(out.at<double>(1, 0), 0.5);
    EXPECT_LT(out.at<double>(2, 0), 0.5);
    EXPECT_GT(out.at<double>(3, 0), 0.5);
}

TEST(KbannModel, ForwardThroughCarriedAndRawInputs)
{
    KnowledgeNetwork net = compileRules("Top :- Mid, z.\nMid :- x.\n");
    Dataset ds = datasetFrom("x,z,y\n1,1,1\n1,0,0\n0,1,0\n");
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);

    KbannModel model(net.weights, net.biases, quietConfig());
    cv::Mat out = model.forward(blocks, false);
    ASSERT_EQ(out.rows, 3);
    EXPECT_GT(out.at<double>(0, 0), 0.5);
    EXPECT_LT(out.at<double>(1, 0), 0.5);
    EXPECT_LT(out.at<double>(2, 0), 0.5);
}

TEST(KbannModel, TrainingLowersTheLoss)
{
    // the rule says AND, the data says OR
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);
    const cv::Mat y = ds.targets();

    TrainingConfig cfg = quietConfig();
    KbannModel model(net.weights, net.biases, cfg);
    const double before = Trainer::evaluate(model, blocks, y);
    const double after  = Trainer(cfg).fit(model, blocks, y);

    EXPECT_LT(after, before);
    EXPECT_LT(Trainer::evaluate(model, blocks, y), before);
}

TEST(KbannModel, FixedWeightsOnlyMoveBiases)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);

    TrainingConfig cfg = quietConfig();
    cfg.initNoise = 0.1;
    cfg.dropout   = 0.2;
    cfg.epochs    = 50;
    KbannModel model(net.weights, net.biases, cfg, true);
    Trainer(cfg).fit(model, blocks, ds.targets());

    EXPECT_TRUE(model.fixedWeights());
    EXPECT_EQ(cv::norm(model.weights()[0], net.weights[0], cv::NORM_INF), 0.0);
    EXPECT_GT(cv::norm(model.biases()[0], net.biases[0], cv::NORM_INF), 0.0);
}

TEST(KbannModel, InitialNoiseIsSmallAndPositive)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    TrainingConfig cfg = quietConfig();
    cfg.initNoise = 0.1;
    KbannModel model(net.weights, net.biases, cfg);

    cv::Mat diff = model.weights()[0] - net.weights[0];
    double lo, hi;
    cv::minMaxLoc(diff, &lo, &hi);
    EXPECT_GE(lo, 0.0);
    EXPECT_LT(hi, 0.1);
}

TEST(KbannModel, RejectsMismatchedParameters)
{
    std::vector<cv::Mat> w{cv::Mat::zeros(2, 1, CV_64F)};
    std::vector<cv::Mat> b{cv::Mat::zeros(1, 2, CV_64F)};
    EXPECT_THROW({ KbannModel m(w, b, quietConfig()); }, ShapeMismatch);
    EXPECT_THROW({ KbannModel m({}, {}, quietConfig()); }, ShapeMismatch);
}

TEST(KbannModel, WrongTargetCountThrows)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);
    KbannModel model(net.weights, net.biases, quietConfig());
    EXPECT_THROW(model.step(blocks, cv::Mat::zeros(3, 1, CV_64F)), ShapeMismatch);
}

TEST(Trainer, ZeroEpochsOnlyEvaluates)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);

    TrainingConfig cfg = quietConfig();
    cfg.epochs = 0;
    KbannModel model(net.weights, net.biases, cfg);
    const double loss = Trainer(cfg).fit(model, blocks, ds.targets());
    EXPECT_DOUBLE_EQ(loss, Trainer::evaluate(model, blocks, ds.targets()));
    EXPECT_EQ(cv::norm(model.weights()[0], net.weights[0], cv::NORM_INF), 0.0);
}

TEST(Trainer, LogsEveryIntervalAndTheLastEpoch)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    Dataset ds = datasetFrom(kTruthTable);
    auto blocks = DataAligner(AlignConfig{}).align(ds, net);

    TrainingConfig cfg = quietConfig();
    cfg.epochs   = 5;
    cfg.logEvery = 2;
    KbannModel model(net.weights, net.biases, cfg);

    std::ostringstream log;
    Trainer(cfg, &log).fit(model, blocks, ds.targets());
    const std::string text = log.str();
    EXPECT_NE(text.find("Epoch 0: Loss = "), std::string::npos);
    EXPECT_NE(text.find("Epoch 2: Loss = "), std::string::npos);
    EXPECT_NE(text.find("Epoch 4: Loss = "), std::string::npos);
    EXPECT_EQ(text.find("Epoch 1:"), std::string::npos);
}
