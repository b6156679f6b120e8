/**
 * @file ut_MultiLayerNetwork.cpp
 * @brief Google Test suite for the stacked network container and metrics.
 */

#include <gtest/gtest.h>

#include "mininn/LossLayers.hpp"
#include "mininn/Metrics.hpp"
#include "mininn/MultiLayerNetwork.hpp"
#include "GradientCheck.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace Test
{

/**
 * @test NETWORK.layer_shapes_follow_neurons
 */
TEST(NETWORK, layer_shapes_follow_neurons)
{
    MultiLayerNetwork<float> net(4, {16, 8, 3},
        {ActivationFunctionType::ReLU, ActivationFunctionType::Sigmoid, ActivationFunctionType::Identity});

    ASSERT_EQ(net.layerCount(), 3u);
    EXPECT_EQ(net.inputDim(), 4u);
    EXPECT_EQ(net.outputDim(), 3u);
    EXPECT_EQ(net.linearLayer(0).weights().rows(), 4);
    EXPECT_EQ(net.linearLayer(0).weights().cols(), 16);
    EXPECT_EQ(net.linearLayer(1).weights().rows(), 16);
    EXPECT_EQ(net.linearLayer(1).weights().cols(), 8);
    EXPECT_EQ(net.linearLayer(2).weights().rows(), 8);
    EXPECT_EQ(net.linearLayer(2).weights().cols(), 3);
    EXPECT_EQ(net.activationLayer(1).type(), ActivationFunctionType::Sigmoid);
}

/**
 * @test NETWORK.forward_backward_shapes
 * @brief Output is (batch, last width), input gradient is (batch, input_dim).
 */
TEST(NETWORK, forward_backward_shapes)
{
    MultiLayerNetwork<double> net(5, {7, 2}, std::vector<std::string>{"tanh", "identity"});
    Matrix<double> x = Matrix<double>::Random(9, 5);

    Matrix<double> y = net(x);
    EXPECT_EQ(y.rows(), 9);
    EXPECT_EQ(y.cols(), 2);

    Matrix<double> grad_x = net.backward(Matrix<double>::Ones(9, 2));
    EXPECT_EQ(grad_x.rows(), 9);
    EXPECT_EQ(grad_x.cols(), 5);
}

/**
 * @test NETWORK.forward_matches_manual_composition
 */
TEST(NETWORK, forward_matches_manual_composition)
{
    MultiLayerNetwork<double> net(2, {2, 1}, std::vector<std::string>{"relu", "sigmoid"});
    net.linearLayer(0).weights() << 1.0, -1.0,
                                    2.0,  1.0;
    net.linearLayer(0).biases() << 0.0, 0.5;
    net.linearLayer(1).weights() << 1.0,
                                    -2.0;
    net.linearLayer(1).biases() << 0.25;

    Matrix<double> x(1, 2);
    x << 1.0, 1.0;

    // hidden = relu([3, 0.5]) = [3, 0.5], output = sigmoid(3 - 1 + 0.25)
    const double expected = 1.0 / (1.0 + std::exp(-2.25));
    EXPECT_NEAR(net.forward(x)(0, 0), expected, 1e-12);
}

/**
 * @test NETWORK.gradient_check
 * @brief Backpropagated input and parameter gradients match finite differences.
 */
TEST(NETWORK, gradient_check)
{
    MiniNN::seed(11);
    MultiLayerNetwork<double> net(3, {6, 4, 2}, std::vector<std::string>{"tanh", "sigmoid", "identity"});
    MSELossLayer<double> loss;

    Matrix<double> x = Matrix<double>::Random(5, 3);
    const Matrix<double> target = Matrix<double>::Random(5, 2);

    auto f = [&]() { return loss.forward(net.forward(x), target); };

    f();
    const Matrix<double> grad_x = net.backward(loss.backward());
    const Matrix<double> grad_W0 = net.linearLayer(0).weightGradients();
    const RowVector<double> grad_b1 = net.linearLayer(1).biasGradients();
    const Matrix<double> grad_W2 = net.linearLayer(2).weightGradients();

    EXPECT_LT(maxAbsDiff(grad_x, numericalGradient(x, f)), 1e-7);
    EXPECT_LT(maxAbsDiff(grad_W0, numericalGradient(net.linearLayer(0).weights(), f)), 1e-7);
    EXPECT_LT(maxAbsDiff(grad_b1, numericalGradient(net.linearLayer(1).biases(), f)), 1e-7);
    EXPECT_LT(maxAbsDiff(grad_W2, numericalGradient(net.linearLayer(2).weights(), f)), 1e-7);
}

/**
 * @test NETWORK.update_params_lowers_loss
 * @brief A small gradient step reduces the loss on the same batch.
 */
TEST(NETWORK, update_params_lowers_loss)
{
    MiniNN::seed(5);
    MultiLayerNetwork<double> net(4, {8, 3}, std::vector<std::string>{"relu", "identity"});
    CrossEntropyLossLayer<double> loss;

    const Matrix<double> x = Matrix<double>::Random(10, 4);
    Matrix<double> target = Matrix<double>::Zero(10, 3);
    for (Eigen::Index i = 0; i < target.rows(); ++i)
    {
        target(i, i % 3) = 1.0;
    }

    const double before = loss.forward(net(x), target);
    net.backward(loss.backward());
    net.updateParams(1e-3);
    const double after = loss.forward(net(x), target);

    EXPECT_LT(after, before);
}

/**
 * @test NETWORK.invalid_configuration_throws
 */
TEST(NETWORK, invalid_configuration_throws)
{
    using Net = MultiLayerNetwork<float>;
    EXPECT_THROW(Net(4, {3}, std::vector<std::string>{"softmax"}), MiniNN::config_error);
    EXPECT_THROW(Net(4, {3, 2}, std::vector<std::string>{"relu"}), MiniNN::config_error);
    EXPECT_THROW(Net(4, {}, std::vector<std::string>{}), MiniNN::config_error);
    EXPECT_THROW(Net(0, {3}, std::vector<std::string>{"relu"}), MiniNN::config_error);
    EXPECT_THROW(Net(4, {0}, std::vector<std::string>{"relu"}), MiniNN::config_error);
}

/**
 * @test NETWORK.wrong_input_width_throws
 */
TEST(NETWORK, wrong_input_width_throws)
{
    MultiLayerNetwork<float> net(4, {3}, std::vector<std::string>{"identity"});
    EXPECT_THROW(net.forward(Matrix<float>::Zero(2, 5)), MiniNN::shape_error);
}

/**
 * @test NETWORK.debug_build_rejects_non_finite_input
 */
TEST(NETWORK, debug_build_rejects_non_finite_input)
{
    MultiLayerNetwork<double, false> net(2, {2}, std::vector<std::string>{"relu"});
    Matrix<double> x = Matrix<double>::Zero(1, 2);
    x(0, 1) = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(net.forward(x), std::domain_error);
}

/**
 * @test NETWORK.predict_classes_and_accuracy
 */
TEST(NETWORK, predict_classes_and_accuracy)
{
    MultiLayerNetwork<double> net(2, {2}, std::vector<std::string>{"identity"});
    net.linearLayer(0).weights().setIdentity();
    net.linearLayer(0).biases().setZero();

    Matrix<double> x(3, 2);
    x << 1.0, 0.0,
         0.0, 1.0,
         2.0, 3.0;
    Matrix<double> target(3, 2);
    target << 1.0, 0.0,
              0.0, 1.0,
              1.0, 0.0;

    const auto classes = net.predictClasses(x);
    ASSERT_EQ(classes.size(), 3u);
    EXPECT_EQ(classes[0], 0);
    EXPECT_EQ(classes[1], 1);
    EXPECT_EQ(classes[2], 1);

    EXPECT_EQ(MiniNN::oneHotMatches(net.predict(x), target), 2u);
    EXPECT_NEAR(MiniNN::accuracy(net.predict(x), target), 2.0 / 3.0, 1e-12);
}

/**
 * @test NETWORK.print_network_info
 */
TEST(NETWORK, print_network_info)
{
    MultiLayerNetwork<float> net(4, {16, 3}, std::vector<std::string>{"relu", "identity"});
    std::ostringstream out;
    net.printNetworkInfo(out);

    const std::string info = out.str();
    EXPECT_NE(info.find("Input Dimension: 4"), std::string::npos);
    EXPECT_NE(info.find("Layer 1: 16 neurons, relu activation, weights 4x16"), std::string::npos);
    EXPECT_NE(info.find("Layer 2: 3 neurons, identity activation"), std::string::npos);
}

} // namespace Test
