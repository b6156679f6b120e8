#ifndef MININN_LAYER_HPP
#define MININN_LAYER_HPP
#pragma once

#include "NetworkDefs.hpp"
#include "WeightInitializers.hpp"

#include <concepts>
#include <random>
#include <string>

/**
 * Abstract layer: a forward transform and the gradient of that transform.
 *
 * forward() caches whatever backward() needs, so a backward pass always refers
 * to the most recent forward pass through the same layer.
 */
template<typename T>
    requires std::floating_point<T>
class Layer {
public:
    virtual ~Layer() = default;

    virtual Matrix<T> forward(const Matrix<T>& x) = 0;

    Matrix<T> operator()(const Matrix<T>& x) { return forward(x); }

    /**
     * Given the gradient of a scalar loss w.r.t. this layer's output, stores the
     * parameter gradients (if any) and returns the gradient w.r.t. the input.
     */
    virtual Matrix<T> backward(const Matrix<T>& grad_z) = 0;

    virtual void updateParams(double /*learning_rate*/) {}

    virtual std::string name() const = 0;
};

/**
 * Affine transform of a batch: x (batch_size, n_in) -> x W + b (batch_size, n_out).
 */
template<typename T>
    requires std::floating_point<T>
class LinearLayer : public Layer<T> {
private:
    size_t _n_in;
    size_t _n_out;

    Matrix<T> _W;
    RowVector<T> _b;

    Matrix<T> _cache_current;
    bool _has_cache = false;

    Matrix<T> _grad_W_current;
    RowVector<T> _grad_b_current;
    bool _has_gradients = false;

public:
    LinearLayer(size_t n_in, size_t n_out, WeightInitializerType initializer = WeightInitializerType::XavierUniform)
        : _n_in(n_in), _n_out(n_out) {
        if (n_in == 0 || n_out == 0)
            throw MiniNN::config_error("LinearLayer: dimensions must be positive, got " + std::to_string(n_in) + " -> " + std::to_string(n_out));

        _W = MiniNN::weight_initializers_map<T>.at(initializer)(_n_in, _n_out);
        _b = MiniNN::sampleMatrix<T>(1, _n_out, std::normal_distribution<double>(0., 1.));

        _grad_W_current = Matrix<T>::Zero(_n_in, _n_out);
        _grad_b_current = RowVector<T>::Zero(_n_out);
    }

    Matrix<T> forward(const Matrix<T>& x) override {
        MININN_CHECK(x.cols() != static_cast<Eigen::Index>(_n_in), MiniNN::shape_error,
            "LinearLayer::forward: expected " + std::to_string(_n_in) + " input columns, got " + MiniNN::shapeString(x.rows(), x.cols()));

        _cache_current = x;
        _has_cache = true;

        Matrix<T> z = (x * _W).rowwise() + _b;
        return z;
    }

    Matrix<T> backward(const Matrix<T>& grad_z) override {
        MININN_CHECK(!_has_cache, MiniNN::shape_error, "LinearLayer::backward called before forward");
        MININN_CHECK(grad_z.rows() != _cache_current.rows() || grad_z.cols() != static_cast<Eigen::Index>(_n_out), MiniNN::shape_error,
            "LinearLayer::backward: expected gradient of shape " + MiniNN::shapeString(_cache_current.rows(), _n_out)
            + ", got " + MiniNN::shapeString(grad_z.rows(), grad_z.cols()));

        _grad_W_current.noalias() = _cache_current.transpose() * grad_z;
        _grad_b_current = grad_z.colwise().sum();
        _has_gradients = true;

        Matrix<T> grad_x = grad_z * _W.transpose();
        return grad_x;
    }

    /**
     * One step of gradient descent with the gradients of the last backward pass.
     * Does nothing before the first backward pass.
     */
    void updateParams(double learning_rate) override {
        if (!_has_gradients)
            return;
        _W.noalias() -= static_cast<T>(learning_rate) * _grad_W_current;
        _b.noalias() -= static_cast<T>(learning_rate) * _grad_b_current;
    }

    std::string name() const override {
        return "linear(" + std::to_string(_n_in) + " -> " + std::to_string(_n_out) + ")";
    }

    size_t inputDim() const { return _n_in; }
    size_t outputDim() const { return _n_out; }

    const Matrix<T>& weights() const { return _W; }
    Matrix<T>& weights() { return _W; }
    const RowVector<T>& biases() const { return _b; }
    RowVector<T>& biases() { return _b; }

    const Matrix<T>& weightGradients() const { return _grad_W_current; }
    const RowVector<T>& biasGradients() const { return _grad_b_current; }
};

#endif
