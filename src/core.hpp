#ifndef ROUNDWISE_CORE_HPP
#define ROUNDWISE_CORE_HPP
/*
 * Core of the library.
 * ---------------------------------------------------------------------------
 *  - network.hpp holds the model container built from layer and block
 *    descriptors.
 *  - quantization/ simulates quantized inference on a copy of a model.
 *  - adaround/ learns the rounding of every weighted layer on top of that
 *    simulation and bakes it into the weights.
 *  - data/, common/ and utils/ are shared plumbing (calibration cache, graph
 *    tracing, JSON, logging).
 */

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "activation/apply.hpp"
#include "adaround/adaround.hpp"
#include "block/block.hpp"
#include "common/graph.hpp"
#include "common/save_load.hpp"
#include "data/data.hpp"
#include "layer/layer.hpp"
#include "loss/loss.hpp"
#include "network.hpp"
#include "optimizer/optimizer.hpp"
#include "quantization/quantization.hpp"
#include "regularization/regularization.hpp"
#include "utils/log.hpp"
#include "utils/progressbar.hpp"
#include "utils/terminal.hpp"

#endif // ROUNDWISE_CORE_HPP
