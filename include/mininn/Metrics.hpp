#ifndef MININN_METRICS_HPP
#define MININN_METRICS_HPP
#pragma once

#include "NetworkDefs.hpp"
#include <vector>

namespace MiniNN {

    template<typename T>
    std::vector<Eigen::Index> argmaxRows(const Matrix<T>& m) {
        std::vector<Eigen::Index> indices(static_cast<size_t>(m.rows()));
        Eigen::Index maxCol;
        for (Eigen::Index row = 0; row < m.rows(); ++row) {
            m.row(row).maxCoeff(&maxCol);
            indices[static_cast<size_t>(row)] = maxCol;
        }
        return indices;
    }

    /**
     * Number of rows whose highest output lands on the 1 of a one-hot target.
     */
    template<typename T>
    size_t oneHotMatches(const Matrix<T>& output, const Matrix<T>& target) {
        MININN_CHECK(output.rows() != target.rows() || output.cols() != target.cols(), shape_error,
            "oneHotMatches: output " + shapeString(output.rows(), output.cols())
            + " does not match target " + shapeString(target.rows(), target.cols()));

        size_t correct_predictions{};
        const auto predicted = argmaxRows(output);
        for (Eigen::Index row = 0; row < output.rows(); ++row) {
            if (target(row, predicted[static_cast<size_t>(row)]) == T(1)) {
                ++correct_predictions;
            }
        }
        return correct_predictions;
    }

    template<typename T>
    double accuracy(const Matrix<T>& output, const Matrix<T>& target) {
        if (output.rows() == 0)
            return 0.0;
        return static_cast<double>(oneHotMatches(output, target)) / static_cast<double>(output.rows());
    }

};

#endif
