#ifndef MININN_NETWORK_DEFS_HPP
#define MININN_NETWORK_DEFS_HPP
#pragma once

#include "Errors.hpp"

#include <Eigen/Core>
#include <functional>
#include <map>
#include <string>

template <typename T>
using Matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

template <typename T>
using RowVector = Eigen::Matrix<T, 1, Eigen::Dynamic>;

template<typename T>
using WeightInitializer = std::function<Matrix<T>(size_t, size_t)>;

enum struct ActivationFunctionType { Identity, ReLU, Sigmoid, Tanh };
enum struct LossFunctionType { MeanSquaredError, SoftmaxCrossEntropy };
enum struct WeightInitializerType { Zero, RandomNormal, RandomUniform, XavierNormal, XavierUniform, HeNormal, HeUniform };

namespace MiniNN {

    inline const std::map<std::string, ActivationFunctionType> activation_names_map = {
        {"identity", ActivationFunctionType::Identity},
        {"linear", ActivationFunctionType::Identity},
        {"relu", ActivationFunctionType::ReLU},
        {"sigmoid", ActivationFunctionType::Sigmoid},
        {"tanh", ActivationFunctionType::Tanh}
    };

    inline const std::map<std::string, LossFunctionType> loss_names_map = {
        {"mse", LossFunctionType::MeanSquaredError},
        {"cross_entropy", LossFunctionType::SoftmaxCrossEntropy},
        {"softmax_cross_entropy", LossFunctionType::SoftmaxCrossEntropy}
    };

    inline ActivationFunctionType parseActivation(const std::string& name) {
        auto it = activation_names_map.find(name);
        if (it == activation_names_map.end())
            throw config_error("unknown activation function '" + name + "', choose between: identity, linear, relu, sigmoid, tanh");
        return it->second;
    }

    inline LossFunctionType parseLoss(const std::string& name) {
        auto it = loss_names_map.find(name);
        if (it == loss_names_map.end())
            throw config_error("unknown loss function '" + name + "', choose between: mse, cross_entropy");
        return it->second;
    }

    inline std::string toString(ActivationFunctionType type) {
        switch (type) {
        case ActivationFunctionType::Identity: return "identity";
        case ActivationFunctionType::ReLU: return "relu";
        case ActivationFunctionType::Sigmoid: return "sigmoid";
        case ActivationFunctionType::Tanh: return "tanh";
        }
        return "unknown";
    }

    inline std::string toString(LossFunctionType type) {
        switch (type) {
        case LossFunctionType::MeanSquaredError: return "mse";
        case LossFunctionType::SoftmaxCrossEntropy: return "cross_entropy";
        }
        return "unknown";
    }

    inline std::string shapeString(Eigen::Index rows, Eigen::Index cols) {
        return std::to_string(rows) + "x" + std::to_string(cols);
    }

};

#endif
