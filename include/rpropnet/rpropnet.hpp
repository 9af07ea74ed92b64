#ifndef RPROPNET_HPP
#define RPROPNET_HPP

// Core
#include "core/Errors.hpp"
#include "core/Matrix.hpp"

// Layers
#include "layers/TransferFunction.hpp"
#include "layers/Dense.hpp"

// Optimizers
#include "optim/Rprop.hpp"

// Model
#include "model.hpp"

// IO
#include "io/Serializer.hpp"

#endif // RPROPNET_HPP
