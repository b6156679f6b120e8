#ifndef MININN_TRAINING_PARAMS_HPP
#define MININN_TRAINING_PARAMS_HPP
#pragma once

#include "NetworkDefs.hpp"
#include <cstddef>

struct TrainingParams {
    size_t _batch_size = 32;
    size_t _epochs = 10;
    double _learning_rate = 0.01;
    LossFunctionType _loss_function_e = LossFunctionType::MeanSquaredError;
    bool _shuffle = true;

    // Print the mean batch loss every _log_interval epochs; 0 keeps training quiet.
    size_t _log_interval = 0;
};

namespace MiniNN {

    inline void validate(const TrainingParams& params) {
        if (params._batch_size == 0)
            throw config_error("batch size must be positive");
        if (!(params._learning_rate >= 0.0))
            throw config_error("learning rate must be non-negative, got " + std::to_string(params._learning_rate));
    }

};

#endif
