#ifndef MININN_LOSS_LAYERS_HPP
#define MININN_LOSS_LAYERS_HPP
#pragma once

#include "NetworkDefs.hpp"
#include <concepts>
#include <memory>
#include <string>

/**
 * Scalar loss between a batch of predictions and targets, both (batch_size, n_out).
 * forward() caches what backward() needs to return d(loss)/d(prediction).
 */
template<typename T>
    requires std::floating_point<T>
class LossLayer {
protected:
    bool _has_cache = false;

    static void checkShapes(const Matrix<T>& y_pred, const Matrix<T>& y_target, const std::string& name) {
        MININN_CHECK(y_pred.rows() != y_target.rows() || y_pred.cols() != y_target.cols(), MiniNN::shape_error,
            name + "::forward: prediction " + MiniNN::shapeString(y_pred.rows(), y_pred.cols())
            + " does not match target " + MiniNN::shapeString(y_target.rows(), y_target.cols()));
        MININN_CHECK(y_pred.rows() == 0, MiniNN::shape_error, name + "::forward: empty batch");
    }

public:
    virtual ~LossLayer() = default;

    virtual T forward(const Matrix<T>& y_pred, const Matrix<T>& y_target) = 0;

    T operator()(const Matrix<T>& y_pred, const Matrix<T>& y_target) { return forward(y_pred, y_target); }

    virtual Matrix<T> backward() const = 0;

    virtual LossFunctionType type() const = 0;
};

/**
 * Mean squared error over every element of the batch.
 */
template<typename T>
    requires std::floating_point<T>
class MSELossLayer : public LossLayer<T> {
private:
    Matrix<T> _y_pred;
    Matrix<T> _y_target;

public:
    static T mse(const Matrix<T>& y_pred, const Matrix<T>& y_target) {
        return (y_pred - y_target).array().square().mean();
    }

    static Matrix<T> mseGrad(const Matrix<T>& y_pred, const Matrix<T>& y_target) {
        return T(2) * (y_pred - y_target) / static_cast<T>(y_pred.size());
    }

    T forward(const Matrix<T>& y_pred, const Matrix<T>& y_target) override {
        LossLayer<T>::checkShapes(y_pred, y_target, "MSELossLayer");
        _y_pred = y_pred;
        _y_target = y_target;
        this->_has_cache = true;
        return mse(y_pred, y_target);
    }

    Matrix<T> backward() const override {
        MININN_CHECK(!this->_has_cache, MiniNN::shape_error, "MSELossLayer::backward called before forward");
        return mseGrad(_y_pred, _y_target);
    }

    LossFunctionType type() const override { return LossFunctionType::MeanSquaredError; }
};

/**
 * Row-wise softmax followed by the negative log-likelihood of one-hot targets,
 * averaged over the batch.
 */
template<typename T>
    requires std::floating_point<T>
class CrossEntropyLossLayer : public LossLayer<T> {
private:
    Matrix<T> _y_target;
    Matrix<T> _probs;

public:
    static Matrix<T> softmax(const Matrix<T>& x) {
        Matrix<T> numer = (x.colwise() - x.rowwise().maxCoeff()).array().exp();
        Matrix<T> denom = numer.rowwise().sum();
        return numer.array().colwise() / denom.col(0).array();
    }

    /**
     * log(softmax(x)) in closed form, finite even where softmax underflows to 0.
     */
    static Matrix<T> logSoftmax(const Matrix<T>& x) {
        Matrix<T> shifted = x.colwise() - x.rowwise().maxCoeff();
        Matrix<T> log_sum = shifted.array().exp().rowwise().sum().log().matrix();
        return shifted.colwise() - log_sum.col(0);
    }

    T forward(const Matrix<T>& inputs, const Matrix<T>& y_target) override {
        LossLayer<T>::checkShapes(inputs, y_target, "CrossEntropyLossLayer");
        const T n_obs = static_cast<T>(y_target.rows());
        _probs = softmax(inputs);
        _y_target = y_target;
        this->_has_cache = true;

        return -(y_target.array() * logSoftmax(inputs).array()).sum() / n_obs;
    }

    Matrix<T> backward() const override {
        MININN_CHECK(!this->_has_cache, MiniNN::shape_error, "CrossEntropyLossLayer::backward called before forward");
        const T n_obs = static_cast<T>(_y_target.rows());
        return -(_y_target - _probs) / n_obs;
    }

    LossFunctionType type() const override { return LossFunctionType::SoftmaxCrossEntropy; }
};

namespace MiniNN {

    template<typename T>
    std::unique_ptr<LossLayer<T>> makeLossLayer(LossFunctionType type) {
        switch (type) {
        case LossFunctionType::MeanSquaredError:
            return std::make_unique<MSELossLayer<T>>();
        case LossFunctionType::SoftmaxCrossEntropy:
            return std::make_unique<CrossEntropyLossLayer<T>>();
        }
        throw config_error("unsupported loss function type " + std::to_string(static_cast<int>(type)));
    }

    template<typename T>
    std::unique_ptr<LossLayer<T>> makeLossLayer(const std::string& name) {
        return makeLossLayer<T>(parseLoss(name));
    }

};

#endif
