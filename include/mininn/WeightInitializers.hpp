#ifndef MININN_WEIGHT_INITIALIZERS_HPP
#define MININN_WEIGHT_INITIALIZERS_HPP
#pragma once

#include "NetworkDefs.hpp"
#include <cmath>
#include <map>
#include <random>

namespace MiniNN {

    // Shared by weight initialization and dataset shuffling.
    inline std::mt19937& generator() {
        static std::mt19937 gen{std::random_device{}()};
        return gen;
    }

    inline void seed(std::mt19937::result_type value) {
        generator().seed(value);
    }

    template<typename T, typename Distribution>
    Matrix<T> sampleMatrix(size_t rows, size_t cols, Distribution dist) {
        Matrix<T> W(rows, cols);
        for (Eigen::Index i = 0; i < W.rows(); ++i)
            for (Eigen::Index j = 0; j < W.cols(); ++j)
                W(i, j) = static_cast<T>(dist(generator()));
        return W;
    }

    /**
     * Xavier (Glorot) uniform initialization of an `in x out` weight matrix,
     * bounded by gain * sqrt(6 / (in + out)).
     */
    template<typename T>
    Matrix<T> xavierInit(size_t in, size_t out, double gain = 1.0) {
        const double bound = gain * std::sqrt(6.0 / static_cast<double>(in + out));
        return sampleMatrix<T>(in, out, std::uniform_real_distribution<double>(-bound, bound));
    }

    template<typename T>
    inline const std::map<WeightInitializerType, WeightInitializer<T>> weight_initializers_map = {
        {
            WeightInitializerType::Zero,
            [](size_t in, size_t out) -> Matrix<T> {return Matrix<T>::Zero(in, out);}
        },
        {
            WeightInitializerType::RandomUniform,
            [](size_t in, size_t out) {
                return sampleMatrix<T>(in, out, std::uniform_real_distribution<double>(0., 1.));
            }
        },
        {
            WeightInitializerType::XavierUniform,
            [](size_t in, size_t out) {return xavierInit<T>(in, out);}
        },
        {
            WeightInitializerType::HeUniform,
            [](size_t in, size_t out) {
                const double bound = std::sqrt(6.0 / static_cast<double>(in));
                return sampleMatrix<T>(in, out, std::uniform_real_distribution<double>(-bound, bound));
            }
        },
        {
            WeightInitializerType::RandomNormal,
            [](size_t in, size_t out) {
                return sampleMatrix<T>(in, out, std::normal_distribution<double>(0., 1.));
            }
        },
        {
            WeightInitializerType::XavierNormal,
            [](size_t in, size_t out) {
                return sampleMatrix<T>(in, out, std::normal_distribution<double>(0., std::sqrt(2.0 / static_cast<double>(in + out))));
            }
        },
        {
            WeightInitializerType::HeNormal,
            [](size_t in, size_t out) {
                return sampleMatrix<T>(in, out, std::normal_distribution<double>(0., std::sqrt(2.0 / static_cast<double>(in))));
            }
        }
    };

};

#endif
