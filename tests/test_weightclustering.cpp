#include <gtest/gtest.h>
#include <set>
#include <vector>

#include "clustering/emmixture.hpp"
#include "clustering/weightclustering.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace kbann;
using kbann::testing::compileRules;
using kbann::testing::failingMixtureFactory;
using kbann::testing::signMixtureFactory;

TEST(WeightClustering, MembersTakeTheirClusterMean)
{
    cv::Mat column = (cv::Mat1d(5, 1) << 4.1, 3.9, -4.2, -3.8, 4.0);
    WeightClustering clustering(signMixtureFactory());

    ClusterAssignment ids = clustering.clusterColumn(column);
    EXPECT_EQ(ids, (ClusterAssignment{0, 0, 1, 1, 0}));

    std::set<double> distinct;
    for (int i = 0; i < column.rows; ++i)
        distinct.insert(column.at<double>(i, 0));
    EXPECT_LE(distinct.size(), 2u);

    EXPECT_EQ(column.at<double>(0, 0), column.at<double>(1, 0));
    EXPECT_EQ(column.at<double>(0, 0), column.at<double>(4, 0));
    EXPECT_EQ(column.at<double>(2, 0), column.at<double>(3, 0));
    EXPECT_NEAR(column.at<double>(0, 0), 4.0, 1e-12);
    EXPECT_NEAR(column.at<double>(2, 0), -4.0, 1e-12);
}

TEST(WeightClustering, SmallColumnsAreNotFitted)
{
    WeightClustering clustering(failingMixtureFactory());

    cv::Mat one = (cv::Mat1d(1, 1) << 2.5);
    EXPECT_EQ(clustering.clusterColumn(one), (ClusterAssignment{0}));
    EXPECT_EQ(one.at<double>(0, 0), 2.5);

    cv::Mat two = (cv::Mat1d(2, 1) << 4.0, -1.0);
    EXPECT_EQ(clustering.clusterColumn(two), (ClusterAssignment{0, 1}));
    EXPECT_EQ(two.at<double>(1, 0), -1.0);
}

TEST(WeightClustering, IdenticalWeightsFormOneCluster)
{
    cv::Mat column = (cv::Mat1d(4, 1) << 0.0, 0.0, 0.0, 0.0);
    EXPECT_EQ(WeightClustering(failingMixtureFactory()).clusterColumn(column),
              (ClusterAssignment{0, 0, 0, 0}));

    // two distinct values cap the model at two components
    std::vector<int> tried;
    MixtureFactory counting = [&tried](int k) {
        tried.push_back(k);
        return signMixtureFactory()(k);
    };
    cv::Mat pair = (cv::Mat1d(5, 1) << 4.0, 0.0, 0.0, 4.0, 0.0);
    EXPECT_EQ(WeightClustering(counting).clusterColumn(pair),
              (ClusterAssignment{0, 1, 1, 0, 1}));
    EXPECT_EQ(tried, (std::vector<int>{2}));
}

TEST(WeightClustering, DegenerateInputThrows)
{
    cv::Mat empty(0, 1, CV_64F);
    EXPECT_THROW(WeightClustering(signMixtureFactory()).clusterColumn(empty),
                 DegenerateClusterInput);

    cv::Mat column = (cv::Mat1d(3, 1) << 1.0, 2.0, 3.0);
    EXPECT_THROW(WeightClustering(failingMixtureFactory()).clusterColumn(column),
                 DegenerateClusterInput);
}

TEST(WeightClustering, EliminateCoversEveryUnit)
{
    KnowledgeNetwork net = compileRules("Top :- Mid, Low.\nMid :- Low.\nLow :- x.\n");
    ClusterAssignments all = WeightClustering(signMixtureFactory()).eliminate(net);

    ASSERT_EQ(all.size(), net.depth());
    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        ASSERT_EQ(all[k].size(), net.outputs(k).size());
        for (const auto& ids : all[k])
            EXPECT_EQ(ids.size(), net.inputs(k).size());
    }
    // toy columns of one or two weights keep their values
    EXPECT_DOUBLE_EQ(net.weights[2].at<double>(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(net.weights[2].at<double>(1, 0), 4.0);
}

TEST(EmMixtureEstimator, ClustersSeparatedWeights)
{
    cv::Mat column = (cv::Mat1d(8, 1) << 4.0, 4.02, 3.98, 4.01,
                                         -4.0, -3.97, -4.03, -4.01);
    WeightClustering clustering(EmMixtureEstimator::factory(ClusteringConfig{}));
    ClusterAssignment ids = clustering.clusterColumn(column);
    ASSERT_EQ(ids.size(), 8u);

    // one shared value per cluster id
    for (int i = 0; i < 8; ++i)
        for (int j = 0; j < 8; ++j)
            if (ids[i] == ids[j])
                EXPECT_EQ(column.at<double>(i, 0), column.at<double>(j, 0));

    // positive and negative weights never share a cluster
    for (int i = 0; i < 4; ++i)
        for (int j = 4; j < 8; ++j)
            EXPECT_NE(ids[i], ids[j]);
}

TEST(EmMixtureEstimator, PredictBeforeFitThrows)
{
    EmMixtureEstimator em(2, ClusteringConfig{});
    EXPECT_EQ(em.components(), 2);
    cv::Mat column = (cv::Mat1d(3, 1) << 1.0, 2.0, 3.0);
    EXPECT_THROW(em.predict(column), std::logic_error);
    EXPECT_THROW({ EmMixtureEstimator bad(0, ClusteringConfig{}); }, std::invalid_argument);
}
