#ifndef MININN_ACTIVATION_LAYERS_HPP
#define MININN_ACTIVATION_LAYERS_HPP
#pragma once

#include "Layer.hpp"
#include <functional>
#include <map>
#include <memory>

template<typename T>
using ActivationFunction = std::function<Matrix<T>(const Matrix<T>&)>;

// Derivative expressed in terms of the activation output, which is what the layers cache.
template<typename T>
using ActivationFunctionDerivative = std::function<Matrix<T>(const Matrix<T>&)>;

namespace MiniNN {
    template<typename T>
    static const std::map<ActivationFunctionType, std::pair<ActivationFunction<T>, ActivationFunctionDerivative<T>>> activation_functions_map = {
        {
            ActivationFunctionType::Identity,
            {
                [](const Matrix<T>& x) -> Matrix<T> {return x;},
                [](const Matrix<T>& y) -> Matrix<T> {return Matrix<T>::Ones(y.rows(), y.cols());}
            }
        },
        {
            ActivationFunctionType::Sigmoid,
            {
                [](const Matrix<T>& x) -> Matrix<T> {return (T(1) + (-x.array()).exp()).inverse();},
                [](const Matrix<T>& y) -> Matrix<T> {return y.array() * (T(1) - y.array());}
            }
        },
        {
            ActivationFunctionType::ReLU,
            {
                [](const Matrix<T>& x) -> Matrix<T> {return x.cwiseMax(T(0));},
                [](const Matrix<T>& y) -> Matrix<T> {return (y.array() > T(0)).template cast<T>();}
            }
        },
        {
            ActivationFunctionType::Tanh,
            {
                [](const Matrix<T>& x) -> Matrix<T> {return x.array().tanh();},
                [](const Matrix<T>& y) -> Matrix<T> {return T(1) - y.array().square();}
            }
        }
    };
};

/**
 * Elementwise nonlinearity. The output of the last forward pass is cached and the
 * backward pass multiplies the incoming gradient by f'(x) computed from it.
 */
template<typename T>
    requires std::floating_point<T>
class ActivationLayer : public Layer<T> {
private:
    ActivationFunctionType _type;
    ActivationFunction<T> _function;
    ActivationFunctionDerivative<T> _derivative;

    Matrix<T> _cache_current;
    bool _has_cache = false;

public:
    explicit ActivationLayer(ActivationFunctionType type) : _type(type) {
        const auto& [function, derivative] = MiniNN::activation_functions_map<T>.at(type);
        _function = function;
        _derivative = derivative;
    }

    Matrix<T> forward(const Matrix<T>& x) override {
        _cache_current = _function(x);
        _has_cache = true;
        return _cache_current;
    }

    Matrix<T> backward(const Matrix<T>& grad_z) override {
        MININN_CHECK(!_has_cache, MiniNN::shape_error, name() + "::backward called before forward");
        MININN_CHECK(grad_z.rows() != _cache_current.rows() || grad_z.cols() != _cache_current.cols(), MiniNN::shape_error,
            name() + "::backward: expected gradient of shape " + MiniNN::shapeString(_cache_current.rows(), _cache_current.cols())
            + ", got " + MiniNN::shapeString(grad_z.rows(), grad_z.cols()));

        Matrix<T> grad_x = grad_z.cwiseProduct(_derivative(_cache_current));
        return grad_x;
    }

    std::string name() const override { return MiniNN::toString(_type); }

    ActivationFunctionType type() const { return _type; }
};

template<typename T>
struct IdentityLayer : public ActivationLayer<T> {
    IdentityLayer() : ActivationLayer<T>(ActivationFunctionType::Identity) {}
};

template<typename T>
struct ReluLayer : public ActivationLayer<T> {
    ReluLayer() : ActivationLayer<T>(ActivationFunctionType::ReLU) {}
};

template<typename T>
struct SigmoidLayer : public ActivationLayer<T> {
    SigmoidLayer() : ActivationLayer<T>(ActivationFunctionType::Sigmoid) {}
};

template<typename T>
struct TanhLayer : public ActivationLayer<T> {
    TanhLayer() : ActivationLayer<T>(ActivationFunctionType::Tanh) {}
};

namespace MiniNN {

    template<typename T>
    std::unique_ptr<ActivationLayer<T>> makeActivationLayer(ActivationFunctionType type) {
        switch (type) {
        case ActivationFunctionType::Identity:
            return std::make_unique<IdentityLayer<T>>();
        case ActivationFunctionType::ReLU:
            return std::make_unique<ReluLayer<T>>();
        case ActivationFunctionType::Sigmoid:
            return std::make_unique<SigmoidLayer<T>>();
        case ActivationFunctionType::Tanh:
            return std::make_unique<TanhLayer<T>>();
        }
        throw config_error("unsupported activation function type " + std::to_string(static_cast<int>(type)));
    }

    template<typename T>
    std::unique_ptr<ActivationLayer<T>> makeActivationLayer(const std::string& name) {
        return makeActivationLayer<T>(parseActivation(name));
    }

};

#endif
