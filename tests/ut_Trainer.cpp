/**
 * @file ut_Trainer.cpp
 * @brief Google Test suite for the mini-batch SGD trainer.
 */

#include <gtest/gtest.h>

#include "mininn/Trainer.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

namespace Test
{

namespace
{

/**
 * @brief Two well separated Gaussian blobs with one-hot labels.
 */
void makeBlobs(Eigen::Index n, Matrix<double>& x, Matrix<double>& y)
{
    std::mt19937 rng(1234);
    std::normal_distribution<double> noise(0.0, 0.3);

    x.resize(n, 2);
    y = Matrix<double>::Zero(n, 2);
    for (Eigen::Index i = 0; i < n; ++i)
    {
        const Eigen::Index label = i % 2;
        const double centre = label == 0 ? -1.5 : 1.5;
        x(i, 0) = centre + noise(rng);
        x(i, 1) = centre + noise(rng);
        y(i, label) = 1.0;
    }
}

double mean(const std::vector<double>& values, size_t first, size_t count)
{
    return std::accumulate(values.begin() + first, values.begin() + first + count, 0.0)
        / static_cast<double>(count);
}

} // namespace

/**
 * @test TRAINER.unknown_loss_throws
 */
TEST(TRAINER, unknown_loss_throws)
{
    MultiLayerNetwork<double> net(2, {1}, std::vector<std::string>{"identity"});
    EXPECT_THROW(Trainer<double>(net, 4, 1, 0.1, "bce", false), MiniNN::config_error);
    EXPECT_THROW(Trainer<double>(net, 4, 1, 0.1, "MSE", false), MiniNN::config_error);
}

/**
 * @test TRAINER.invalid_hyper_parameters_throw
 */
TEST(TRAINER, invalid_hyper_parameters_throw)
{
    MultiLayerNetwork<double> net(2, {1}, std::vector<std::string>{"identity"});
    EXPECT_THROW(Trainer<double>(net, 0, 1, 0.1, "mse", false), MiniNN::config_error);
    EXPECT_THROW(Trainer<double>(net, 4, 1, -0.1, "mse", false), MiniNN::config_error);
}

/**
 * @test TRAINER.shuffle_keeps_rows_aligned
 * @brief Inputs and targets are permuted together and nothing is lost.
 */
TEST(TRAINER, shuffle_keeps_rows_aligned)
{
    MiniNN::seed(99);
    const Eigen::Index n = 50;
    Matrix<double> x(n, 2);
    Matrix<double> y(n, 1);
    for (Eigen::Index i = 0; i < n; ++i)
    {
        x(i, 0) = static_cast<double>(i);
        x(i, 1) = -static_cast<double>(i);
        y(i, 0) = 10.0 * static_cast<double>(i);
    }

    auto [xs, ys] = Trainer<double>::shuffle(x, y);

    ASSERT_EQ(xs.rows(), n);
    ASSERT_EQ(ys.rows(), n);
    std::vector<double> seen;
    for (Eigen::Index i = 0; i < n; ++i)
    {
        EXPECT_EQ(ys(i, 0), 10.0 * xs(i, 0));
        EXPECT_EQ(xs(i, 1), -xs(i, 0));
        seen.push_back(xs(i, 0));
    }
    std::sort(seen.begin(), seen.end());
    for (Eigen::Index i = 0; i < n; ++i)
    {
        EXPECT_EQ(seen[static_cast<size_t>(i)], static_cast<double>(i));
    }
    EXPECT_FALSE(xs == x);
}

/**
 * @test TRAINER.shuffle_row_mismatch_throws
 */
TEST(TRAINER, shuffle_row_mismatch_throws)
{
    EXPECT_THROW(Trainer<double>::shuffle(Matrix<double>::Zero(3, 2), Matrix<double>::Zero(4, 1)),
                 MiniNN::shape_error);
}

/**
 * @test TRAINER.loss_history_has_one_entry_per_batch
 * @brief 10 rows in batches of 4 give 3 batches (4, 4, 2) per epoch.
 */
TEST(TRAINER, loss_history_has_one_entry_per_batch)
{
    MultiLayerNetwork<double> net(3, {1}, std::vector<std::string>{"identity"});
    Trainer<double> trainer(net, 4, 5, 0.01, "mse", true);

    const Matrix<double> x = Matrix<double>::Random(10, 3);
    const Matrix<double> y = Matrix<double>::Random(10, 1);

    EXPECT_EQ(trainer.train(x, y).size(), 15u);
}

/**
 * @test TRAINER.zero_learning_rate_keeps_parameters
 */
TEST(TRAINER, zero_learning_rate_keeps_parameters)
{
    MultiLayerNetwork<double> net(3, {4, 1}, std::vector<std::string>{"relu", "identity"});
    const Matrix<double> W0 = net.linearLayer(0).weights();
    const RowVector<double> b1 = net.linearLayer(1).biases();

    Trainer<double> trainer(net, 2, 3, 0.0, "mse", true);
    trainer.train(Matrix<double>::Random(6, 3), Matrix<double>::Random(6, 1));

    EXPECT_TRUE(net.linearLayer(0).weights() == W0);
    EXPECT_TRUE(net.linearLayer(1).biases() == b1);
}

/**
 * @test TRAINER.linear_regression_converges
 * @brief A single identity layer recovers y = 2 x0 - x1 + 0.5 under MSE.
 */
TEST(TRAINER, linear_regression_converges)
{
    MiniNN::seed(2024);
    const Matrix<double> x = (Matrix<double>::Random(64, 2).array() + 1.0) / 2.0;
    Matrix<double> y(64, 1);
    y.col(0) = 2.0 * x.col(0) - x.col(1) + Matrix<double>::Constant(64, 1, 0.5);

    MultiLayerNetwork<double> net(2, {1}, std::vector<std::string>{"identity"});
    TrainingParams params;
    params._batch_size = 8;
    params._epochs = 500;
    params._learning_rate = 0.1;
    params._loss_function_e = LossFunctionType::MeanSquaredError;
    params._shuffle = true;

    Trainer<double> trainer(net, params);
    const double initial = trainer.evalLoss(x, y);
    trainer.train(x, y);
    const double final_loss = trainer.evalLoss(x, y);

    EXPECT_LT(final_loss, initial);
    EXPECT_LT(final_loss, 1e-4);
    EXPECT_NEAR(net.linearLayer(0).weights()(0, 0), 2.0, 0.05);
    EXPECT_NEAR(net.linearLayer(0).weights()(1, 0), -1.0, 0.05);
    EXPECT_NEAR(net.linearLayer(0).biases()(0), 0.5, 0.05);
}

/**
 * @test TRAINER.classification_loss_decreases
 * @brief Softmax cross-entropy training separates two blobs.
 */
TEST(TRAINER, classification_loss_decreases)
{
    MiniNN::seed(17);
    Matrix<double> x;
    Matrix<double> y;
    makeBlobs(100, x, y);

    MultiLayerNetwork<double> net(2, {8, 2}, std::vector<std::string>{"relu", "identity"});
    Trainer<double> trainer(net, 10, 50, 0.1, "cross_entropy", true);

    const std::vector<double> history = trainer.train(x, y);
    ASSERT_EQ(history.size(), 500u);

    const double first_epoch = mean(history, 0, 10);
    const double last_epoch = mean(history, history.size() - 10, 10);
    EXPECT_LT(last_epoch, first_epoch);
    EXPECT_LT(trainer.evalLoss(x, y), 0.3);
    EXPECT_GT(MiniNN::accuracy(net(x), y), 0.95);
}

/**
 * @test TRAINER.eval_loss_row_mismatch_throws
 */
TEST(TRAINER, eval_loss_row_mismatch_throws)
{
    MultiLayerNetwork<float> net(2, {1}, std::vector<std::string>{"identity"});
    Trainer<float> trainer(net, 4, 1, 0.1f, "mse", false);

    EXPECT_THROW(trainer.evalLoss(Matrix<float>::Zero(3, 2), Matrix<float>::Zero(2, 1)), MiniNN::shape_error);
    EXPECT_THROW(trainer.train(Matrix<float>::Zero(3, 2), Matrix<float>::Zero(3, 2)), MiniNN::shape_error);
}

} // namespace Test
