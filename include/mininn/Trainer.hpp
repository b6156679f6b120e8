#ifndef MININN_TRAINER_HPP
#define MININN_TRAINER_HPP
#pragma once

#include "MultiLayerNetwork.hpp"
#include "LossLayers.hpp"
#include "TrainingParams.hpp"
#include "DataLoader.hpp"

#include <algorithm>
#include <concepts>
#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * Mini-batch stochastic gradient descent on a MultiLayerNetwork.
 *
 * The trainer holds a reference to the network; the network must outlive it.
 */
template <typename T = float, bool _Release = true>
    requires std::floating_point<T>
class Trainer {
private:
    MultiLayerNetwork<T, _Release>& _network;
    TrainingParams _params;
    std::unique_ptr<LossLayer<T>> _loss_layer;
    Matrix<T> _grad_z;

    static TrainingParams _makeParams(size_t batch_size, size_t nb_epoch, double learning_rate, const std::string& loss_fun, bool shuffle_flag) {
        TrainingParams params;
        params._batch_size = batch_size;
        params._epochs = nb_epoch;
        params._learning_rate = learning_rate;
        params._loss_function_e = MiniNN::parseLoss(loss_fun);
        params._shuffle = shuffle_flag;
        return params;
    }

    static void _checkRows(const Matrix<T>& input_dataset, const Matrix<T>& target_dataset, const std::string& caller) {
        MININN_CHECK(input_dataset.rows() != target_dataset.rows(), MiniNN::shape_error,
            caller + ": " + std::to_string(input_dataset.rows()) + " input rows but "
            + std::to_string(target_dataset.rows()) + " target rows");
    }

public:
    Trainer(MultiLayerNetwork<T, _Release>& network, const TrainingParams& params)
        : _network(network), _params(params) {
        MiniNN::validate(_params);
        _loss_layer = MiniNN::makeLossLayer<T>(_params._loss_function_e);
    }

    /**
     * @param loss_fun "mse" or "cross_entropy" (softmax followed by negative log-likelihood).
     */
    Trainer(MultiLayerNetwork<T, _Release>& network, size_t batch_size, size_t nb_epoch, double learning_rate,
            const std::string& loss_fun, bool shuffle_flag)
        : Trainer(network, _makeParams(batch_size, nb_epoch, learning_rate, loss_fun, shuffle_flag)) {}

    /**
     * Applies the same random row permutation to inputs and targets.
     */
    static std::pair<Matrix<T>, Matrix<T>> shuffle(const Matrix<T>& input_dataset, const Matrix<T>& target_dataset) {
        _checkRows(input_dataset, target_dataset, "Trainer::shuffle");

        const auto permutation = MiniNN::randomPermutation(input_dataset.rows());
        Matrix<T> shuffled_inputs = permutation * input_dataset;
        Matrix<T> shuffled_targets = permutation * target_dataset;
        return {std::move(shuffled_inputs), std::move(shuffled_targets)};
    }

    /**
     * Runs _epochs passes over the data. Each pass optionally shuffles, then for
     * every consecutive batch of _batch_size rows (the last one may be shorter)
     * does forward, loss, backward and one parameter update.
     *
     * @return The loss of every batch, in training order.
     */
    std::vector<T> train(const Matrix<T>& input_dataset, const Matrix<T>& target_dataset) {
        _checkRows(input_dataset, target_dataset, "Trainer::train");
        checkDimensions(input_dataset, input_dataset.rows(), static_cast<Eigen::Index>(_network.inputDim()), "Training Input");
        checkDimensions(target_dataset, target_dataset.rows(), static_cast<Eigen::Index>(_network.outputDim()), "Training Target");

        const Eigen::Index n_rows = input_dataset.rows();
        const Eigen::Index batch_size = static_cast<Eigen::Index>(_params._batch_size);

        std::vector<T> loss_history;
        Matrix<T> inputs = input_dataset;
        Matrix<T> targets = target_dataset;

        for (size_t epoch = 0; epoch < _params._epochs; ++epoch) {
            if (_params._shuffle) {
                std::tie(inputs, targets) = shuffle(inputs, targets);
            }

            double total_cost = 0.0;
            size_t num_batches = 0;
            for (Eigen::Index i = 0; i < n_rows; i += batch_size) {
                const Eigen::Index rows = std::min(batch_size, n_rows - i);
                T loss = evalLoss(inputs.middleRows(i, rows), targets.middleRows(i, rows));
                _network.backward(_grad_z);
                _network.updateParams(_params._learning_rate);

                loss_history.push_back(loss);
                total_cost += static_cast<double>(loss);
                ++num_batches;
            }

            if (_params._log_interval != 0 && (epoch + 1) % _params._log_interval == 0 && num_batches != 0) {
                std::cout << "Epoch: " << epoch + 1 << "/" << _params._epochs
                          << " Cost: " << total_cost / static_cast<double>(num_batches) << std::endl;
            }
        }
        return loss_history;
    }

    /**
     * Loss of the network on the given data. The loss gradient is kept so that a
     * following backward pass can use it.
     */
    T evalLoss(const Matrix<T>& input_dataset, const Matrix<T>& target_dataset) {
        _checkRows(input_dataset, target_dataset, "Trainer::evalLoss");
        Matrix<T> prediction = _network.forward(input_dataset);

        T loss = _loss_layer->forward(prediction, target_dataset);
        _grad_z = _loss_layer->backward();
        return loss;
    }

    const TrainingParams& params() const { return _params; }
    LossFunctionType lossType() const { return _loss_layer->type(); }
};

#endif
