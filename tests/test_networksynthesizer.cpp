#include <gtest/gtest.h>
#include <string>

#include "errors.hpp"
#include "test_helpers.hpp"

using namespace kbann;
using kbann::testing::compileRules;
using kbann::testing::thresholdLayer;

TEST(NetworkSynthesizer, ToyRuleWeightsAndBias)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    ASSERT_EQ(net.depth(), 1u);
    EXPECT_EQ(net.inputs(0), (UnitNames{"A", "B"}));
    EXPECT_EQ(net.outputs(0), (UnitNames{"Target"}));
    EXPECT_DOUBLE_EQ(net.weights[0].at<double>(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(net.weights[0].at<double>(1, 0), 4.0);
    EXPECT_DOUBLE_EQ(net.biases[0].at<double>(0, 0), 6.0);
}

TEST(NetworkSynthesizer, OmegaScalesEverything)
{
    KnowledgeNetwork net = compileRules("H :- A, not B.\n", 2.0);
    EXPECT_DOUBLE_EQ(net.weights[0].at<double>(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(net.weights[0].at<double>(1, 0), -2.0);
    EXPECT_DOUBLE_EQ(net.biases[0].at<double>(0, 0), 3.0);
}

TEST(NetworkSynthesizer, ConjunctionFiresOnlyWhenAllTrue)
{
    KnowledgeNetwork net = compileRules("H :- A, B, C.\n");
    EXPECT_DOUBLE_EQ(net.biases[0].at<double>(0, 0), 10.0);

    cv::Mat1d x = (cv::Mat1d(4, 3) << 1, 1, 1,
                                      1, 1, 0,
                                      0, 1, 1,
                                      0, 0, 0);
    cv::Mat h = thresholdLayer(x, net.weights[0], net.biases[0]);
    EXPECT_EQ(h.at<double>(0, 0), 1.0);
    EXPECT_EQ(h.at<double>(1, 0), 0.0);
    EXPECT_EQ(h.at<double>(2, 0), 0.0);
    EXPECT_EQ(h.at<double>(3, 0), 0.0);
}

TEST(NetworkSynthesizer, NegatedLiteralLowersActivation)
{
    KnowledgeNetwork net = compileRules("H :- A, not B.\n");
    const cv::Mat& w = net.weights[0];
    // A true and B false gives the largest net input of the four cases
    EXPECT_GT(w.at<double>(0, 0), 0.0);
    EXPECT_LT(w.at<double>(1, 0), 0.0);
}

TEST(NetworkSynthesizer, DisjunctionFiresWhenAnyBodyHolds)
{
    KnowledgeNetwork net = compileRules("H :- A.\nH :- B.\n");
    ASSERT_EQ(net.depth(), 2u);
    EXPECT_EQ(net.inputs(0), (UnitNames{"A", "B"}));
    EXPECT_EQ(net.outputs(0), (UnitNames{"H2", "H3"}));
    EXPECT_EQ(net.outputs(1), (UnitNames{"H"}));
    EXPECT_DOUBLE_EQ(net.biases[1].at<double>(0, 0), 2.0);

    cv::Mat1d x = (cv::Mat1d(4, 2) << 0, 0,
                                      1, 0,
                                      0, 1,
                                      1, 1);
    cv::Mat mid = thresholdLayer(x, net.weights[0], net.biases[0]);
    cv::Mat h   = thresholdLayer(mid, net.weights[1], net.biases[1]);
    EXPECT_EQ(h.at<double>(0, 0), 0.0);
    EXPECT_EQ(h.at<double>(1, 0), 1.0);
    EXPECT_EQ(h.at<double>(2, 0), 1.0);
    EXPECT_EQ(h.at<double>(3, 0), 1.0);
}

TEST(NetworkSynthesizer, CarriesLiteralsAcrossSkippedLayers)
{
    KnowledgeNetwork net = compileRules("Top :- Mid, Low.\nMid :- Low.\nLow :- x.\n");
    ASSERT_EQ(net.depth(), 3u);
    EXPECT_EQ(net.outputs(0), (UnitNames{"Low"}));
    EXPECT_EQ(net.outputs(1), (UnitNames{"Mid", "Low"}));
    EXPECT_EQ(net.inputs(2),  (UnitNames{"Mid", "Low"}));

    // carry unit: one +omega link from itself, bias 0.5 omega
    EXPECT_DOUBLE_EQ(net.weights[1].at<double>(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(net.biases[1].at<double>(0, 1), 2.0);

    for (double v : {0.0, 1.0})
    {
        cv::Mat1d x(1, 1, v);
        cv::Mat a = x;
        for (std::size_t k = 0; k < net.depth(); ++k)
            a = thresholdLayer(a, net.weights[k], net.biases[k]);
        EXPECT_EQ(a.at<double>(0, 0), v);
    }
}

TEST(KnowledgeNetwork, ValidateCatchesBrokenShapes)
{
    KnowledgeNetwork net = compileRules("Target :- A, B.\n");
    EXPECT_NO_THROW(net.validate());

    KnowledgeNetwork copy = net.clone();
    copy.layers[0].push_back("C");
    EXPECT_THROW(copy.validate(), ShapeMismatch);

    copy = net.clone();
    copy.biases[0] = cv::Mat::zeros(1, 2, CV_64F);
    EXPECT_THROW(copy.validate(), ShapeMismatch);

    copy = net.clone();
    copy.weights[0].convertTo(copy.weights[0], CV_32F);
    try {
        copy.validate();
        FAIL() << "expected ShapeMismatch";
    } catch (const ShapeMismatch& e) {
        EXPECT_NE(std::string(e.what()).find("weights 2x1 32FC1"), std::string::npos) << e.what();
    }
}

TEST(KnowledgeNetwork, CloneIsDeep)
{
    KnowledgeNetwork net  = compileRules("Target :- A, B.\n");
    KnowledgeNetwork copy = net.clone();
    copy.weights[0].at<double>(0, 0) = 0.0;
    EXPECT_DOUBLE_EQ(net.weights[0].at<double>(0, 0), 4.0);
}

TEST(KnowledgeNetwork, FreshInputsExcludeCarriedUnits)
{
    KnowledgeNetwork net = compileRules("Top :- Mid, z.\nMid :- x.\n");
    EXPECT_EQ(net.freshInputs(0), (UnitNames{"x"}));
    EXPECT_EQ(net.freshInputs(1), (UnitNames{"z"}));
    EXPECT_EQ(net.allUnits(), (UnitNames{"x", "Mid", "z", "Top"}));
}
