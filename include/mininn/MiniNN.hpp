#ifndef MININN_HPP
#define MININN_HPP
#pragma once

#include "Errors.hpp"
#include "NetworkDefs.hpp"
#include "WeightInitializers.hpp"
#include "Layer.hpp"
#include "ActivationLayers.hpp"
#include "LossLayers.hpp"
#include "Metrics.hpp"
#include "MultiLayerNetwork.hpp"
#include "NetworkSerialization.hpp"
#include "TrainingParams.hpp"
#include "Trainer.hpp"
#include "Preprocessor.hpp"
#include "DataLoader.hpp"

#endif
