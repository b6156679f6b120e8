#ifndef MININN_MULTI_LAYER_NETWORK_HPP
#define MININN_MULTI_LAYER_NETWORK_HPP
#pragma once

#include "NetworkDefs.hpp"
#include "Layer.hpp"
#include "ActivationLayers.hpp"
#include "Metrics.hpp"

#include <Eigen/Core>
#include <concepts>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

template <typename T>
void checkFinite(const Matrix<T>& mat, const std::string& name) {
    if (!mat.array().isFinite().all()) {
        std::cerr << "Error: Matrix " << name << " contains inf or nan values!" << std::endl;
        throw std::domain_error("Matrix " + name + " contains inf or nan values");
    }
}

template <typename T>
void checkDimensions(const Matrix<T>& mat, Eigen::Index rows, Eigen::Index cols, const std::string& name) {
    MININN_CHECK(mat.rows() != rows || mat.cols() != cols, MiniNN::shape_error,
        "Matrix " + name + " has incorrect dimensions. Expected: " + MiniNN::shapeString(rows, cols)
        + ", Got: " + MiniNN::shapeString(mat.rows(), mat.cols()));
}

/**
 * Stack of (linear, activation) layer pairs.
 *
 * With _Release = false every intermediate output is checked for inf/nan, which
 * is the quickest way to find a diverging learning rate.
 */
template <typename T = float, bool _Release = true>
    requires std::floating_point<T>
class MultiLayerNetwork {
private:
    size_t _input_dim;
    std::vector<size_t> _neurons;
    std::vector<ActivationFunctionType> _activation_enums;

    std::vector<std::unique_ptr<LinearLayer<T>>> _linear_layers;
    std::vector<std::unique_ptr<ActivationLayer<T>>> _activation_layers;

    static std::vector<ActivationFunctionType> _parseActivations(const std::vector<std::string>& names) {
        std::vector<ActivationFunctionType> types;
        types.reserve(names.size());
        for (const auto& name : names)
            types.push_back(MiniNN::parseActivation(name));
        return types;
    }

public:
    MultiLayerNetwork(size_t input_dim, std::vector<size_t> neurons, std::vector<ActivationFunctionType> activations)
        : _input_dim(input_dim), _neurons(std::move(neurons)), _activation_enums(std::move(activations)) {

        if (_input_dim == 0)
            throw MiniNN::config_error("MultiLayerNetwork: input dimension must be positive");
        if (_neurons.empty())
            throw MiniNN::config_error("MultiLayerNetwork: at least one layer is required");
        if (_neurons.size() != _activation_enums.size())
            throw MiniNN::config_error("MultiLayerNetwork: got " + std::to_string(_neurons.size()) + " layer widths but "
                + std::to_string(_activation_enums.size()) + " activation functions");

        size_t fan_in = _input_dim;
        for (size_t i = 0; i < _neurons.size(); ++i) {
            _linear_layers.push_back(std::make_unique<LinearLayer<T>>(fan_in, _neurons[i]));
            _activation_layers.push_back(MiniNN::makeActivationLayer<T>(_activation_enums[i]));
            fan_in = _neurons[i];
        }
    }

    MultiLayerNetwork(size_t input_dim, std::vector<size_t> neurons, const std::vector<std::string>& activations)
        : MultiLayerNetwork(input_dim, std::move(neurons), _parseActivations(activations)) {}

    MultiLayerNetwork(MultiLayerNetwork&&) noexcept = default;
    MultiLayerNetwork& operator=(MultiLayerNetwork&&) noexcept = default;

    /**
     * @param x Input of shape (batch_size, input_dim).
     * @return Output of shape (batch_size, neurons.back()).
     */
    Matrix<T> forward(const Matrix<T>& x) {
        if constexpr (!_Release) {
            checkFinite(x, "Input");
        }

        Matrix<T> a = x;
        for (size_t i = 0; i < _linear_layers.size(); ++i) {
            Matrix<T> z = _linear_layers[i]->forward(a);
            if constexpr (!_Release) {
                checkFinite(z, "Z (Layer " + std::to_string(i) + ")");
            }

            a = _activation_layers[i]->forward(z);
            if constexpr (!_Release) {
                checkFinite(a, "Activations (Layer " + std::to_string(i) + ")");
            }
        }
        return a;
    }

    Matrix<T> operator()(const Matrix<T>& x) { return forward(x); }

    /**
     * @param grad_z Gradient of the loss w.r.t. the network output.
     * @return Gradient of the loss w.r.t. the network input, (batch_size, input_dim).
     */
    Matrix<T> backward(const Matrix<T>& grad_z) {
        Matrix<T> grad = grad_z;
        for (size_t i = _linear_layers.size(); i-- > 0;) {
            grad = _linear_layers[i]->backward(_activation_layers[i]->backward(grad));
            if constexpr (!_Release) {
                checkFinite(grad, "DZ (Layer " + std::to_string(i) + ")");
            }
        }
        return grad;
    }

    void updateParams(double learning_rate) {
        for (auto& layer : _linear_layers)
            layer->updateParams(learning_rate);
    }

    Matrix<T> predict(const Matrix<T>& x) { return forward(x); }

    std::vector<Eigen::Index> predictClasses(const Matrix<T>& x) {
        return MiniNN::argmaxRows<T>(forward(x));
    }

    size_t inputDim() const { return _input_dim; }
    size_t outputDim() const { return _neurons.back(); }
    size_t layerCount() const { return _linear_layers.size(); }
    const std::vector<size_t>& neurons() const { return _neurons; }
    const std::vector<ActivationFunctionType>& activations() const { return _activation_enums; }

    LinearLayer<T>& linearLayer(size_t i) { return *_linear_layers.at(i); }
    const LinearLayer<T>& linearLayer(size_t i) const { return *_linear_layers.at(i); }
    ActivationLayer<T>& activationLayer(size_t i) { return *_activation_layers.at(i); }

    void printNetworkInfo(std::ostream& out = std::cout) const {
        out << "Neural Network Information:\n";
        out << "Input Dimension: " << _input_dim << "\n";
        out << "Total Layers: " << _linear_layers.size() << "\n";

        out << "Layers:\n";
        for (size_t i = 0; i < _linear_layers.size(); ++i) {
            const auto& W = _linear_layers[i]->weights();
            const auto& b = _linear_layers[i]->biases();
            out << "  Layer " << i + 1 << ": " << _neurons[i] << " neurons, "
                << MiniNN::toString(_activation_enums[i]) << " activation, weights "
                << MiniNN::shapeString(W.rows(), W.cols()) << ", biases "
                << MiniNN::shapeString(b.rows(), b.cols()) << "\n";
        }
    }
};

#endif
