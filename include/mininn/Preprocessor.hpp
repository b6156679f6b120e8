#ifndef MININN_PREPROCESSOR_HPP
#define MININN_PREPROCESSOR_HPP
#pragma once

#include "NetworkDefs.hpp"
#include <concepts>

/**
 * Per-column min-max scaling fitted on a reference dataset.
 *
 * apply() maps every column of the reference data onto [0, 1]; revert() undoes
 * it. A constant column keeps a scale of 1, so it maps to 0 and back exactly.
 */
template<typename T>
    requires std::floating_point<T>
class Preprocessor {
private:
    RowVector<T> _min_data;
    RowVector<T> _max_data;
    RowVector<T> _range;

    void _checkColumns(const Matrix<T>& data, const char* caller) const {
        MININN_CHECK(data.cols() != _min_data.cols(), MiniNN::shape_error,
            std::string(caller) + ": expected " + std::to_string(_min_data.cols()) + " columns, got "
            + MiniNN::shapeString(data.rows(), data.cols()));
    }

public:
    explicit Preprocessor(const Matrix<T>& data) {
        if (data.rows() == 0 || data.cols() == 0)
            throw MiniNN::config_error("Preprocessor: cannot fit on an empty dataset");

        _min_data = data.colwise().minCoeff();
        _max_data = data.colwise().maxCoeff();
        _range = _max_data - _min_data;
        for (Eigen::Index j = 0; j < _range.cols(); ++j) {
            if (_range(j) == T(0))
                _range(j) = T(1);
        }
    }

    Matrix<T> apply(const Matrix<T>& data) const {
        _checkColumns(data, "Preprocessor::apply");
        Matrix<T> normalised = (data.rowwise() - _min_data).array().rowwise() / _range.array();
        return normalised;
    }

    Matrix<T> revert(const Matrix<T>& normalised_data) const {
        _checkColumns(normalised_data, "Preprocessor::revert");
        Matrix<T> data = (normalised_data.array().rowwise() * _range.array()).matrix().rowwise() + _min_data;
        return data;
    }

    const RowVector<T>& min() const { return _min_data; }
    const RowVector<T>& max() const { return _max_data; }
};

#endif
