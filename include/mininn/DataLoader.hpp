#ifndef MININN_DATA_LOADER_HPP
#define MININN_DATA_LOADER_HPP
#pragma once

#include "NetworkDefs.hpp"
#include "WeightInitializers.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace MiniNN {

    /**
     * Reads a whitespace separated numeric table, one sample per line.
     * Everything after a '#' is a comment; blank lines are skipped.
     */
    template<typename T>
    Matrix<T> loadDataset(const std::filesystem::path& filename) {
        std::ifstream inFile(filename);
        if (!inFile) {
            std::cerr << "Error opening dataset for reading: " << filename << std::endl;
            throw io_error("cannot open dataset " + filename.string());
        }

        std::vector<std::vector<T>> rows;
        std::string line;
        size_t line_number = 0;
        while (std::getline(inFile, line)) {
            ++line_number;
            const auto comment = line.find('#');
            if (comment != std::string::npos)
                line.erase(comment);
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            std::istringstream tokens(line);
            std::vector<T> row;
            std::string token;
            while (tokens >> token) {
                size_t consumed = 0;
                double value = 0.0;
                try {
                    value = std::stod(token, &consumed);
                }
                catch (const std::exception&) {
                    consumed = 0;
                }
                if (consumed != token.size()) {
                    throw io_error(filename.string() + ":" + std::to_string(line_number) + ": not a number '" + token + "'");
                }
                if (std::isfinite(value) && std::abs(value) > static_cast<double>(std::numeric_limits<T>::max())) {
                    throw io_error(filename.string() + ":" + std::to_string(line_number) + ": value '" + token
                        + "' out of range for the scalar type");
                }
                row.push_back(static_cast<T>(value));
            }

            if (!rows.empty() && row.size() != rows.front().size()) {
                throw io_error(filename.string() + ":" + std::to_string(line_number) + ": expected "
                    + std::to_string(rows.front().size()) + " columns, got " + std::to_string(row.size()));
            }
            rows.push_back(std::move(row));
        }

        const Eigen::Index n_cols = rows.empty() ? 0 : static_cast<Eigen::Index>(rows.front().size());
        Matrix<T> data(static_cast<Eigen::Index>(rows.size()), n_cols);
        for (Eigen::Index i = 0; i < data.rows(); ++i)
            for (Eigen::Index j = 0; j < n_cols; ++j)
                data(i, j) = rows[static_cast<size_t>(i)][static_cast<size_t>(j)];
        return data;
    }

    /**
     * Splits a table into its first `n_features` columns and the remaining target columns.
     */
    template<typename T>
    std::pair<Matrix<T>, Matrix<T>> splitColumns(const Matrix<T>& data, Eigen::Index n_features) {
        MININN_CHECK(n_features <= 0 || n_features >= data.cols(), shape_error,
            "splitColumns: cannot take " + std::to_string(n_features) + " feature columns out of "
            + std::to_string(data.cols()));
        return {data.leftCols(n_features), data.rightCols(data.cols() - n_features)};
    }

    using Permutation = Eigen::PermutationMatrix<Eigen::Dynamic, Eigen::Dynamic>;

    inline Permutation randomPermutation(Eigen::Index size) {
        Permutation permutation(size);
        permutation.setIdentity();
        std::shuffle(permutation.indices().data(), permutation.indices().data() + permutation.indices().size(), generator());
        return permutation;
    }

    template<typename T>
    Matrix<T> shuffleRows(const Matrix<T>& data) {
        Matrix<T> shuffled = randomPermutation(data.rows()) * data;
        return shuffled;
    }

    template<typename T>
    struct DataSplit {
        Matrix<T> x_train;
        Matrix<T> y_train;
        Matrix<T> x_val;
        Matrix<T> y_val;
    };

    /**
     * The first floor(train_fraction * rows) rows go to training, the rest to validation.
     */
    template<typename T>
    DataSplit<T> trainValidationSplit(const Matrix<T>& x, const Matrix<T>& y, double train_fraction) {
        MININN_CHECK(x.rows() != y.rows(), shape_error,
            "trainValidationSplit: " + std::to_string(x.rows()) + " input rows but " + std::to_string(y.rows()) + " target rows");
        if (!(train_fraction >= 0.0 && train_fraction <= 1.0))
            throw config_error("trainValidationSplit: fraction must lie in [0, 1], got " + std::to_string(train_fraction));

        const auto split_idx = static_cast<Eigen::Index>(std::floor(train_fraction * static_cast<double>(x.rows())));
        return {x.topRows(split_idx), y.topRows(split_idx), x.bottomRows(x.rows() - split_idx), y.bottomRows(y.rows() - split_idx)};
    }

};

#endif
