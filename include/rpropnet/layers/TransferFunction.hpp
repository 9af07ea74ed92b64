#ifndef RPROPNET_LAYERS_TRANSFERFUNCTION_HPP
#define RPROPNET_LAYERS_TRANSFERFUNCTION_HPP

#include <cmath>
#include <string>
#include <algorithm>
#include "../core/Errors.hpp"

namespace rpropnet {
namespace layers {

enum class TransferFunction {
    Identity,
    ReLU,
    LeakyReLU,
    Tanh,
    Sigmoid,
    Sigmoid2
};

/**
 * @brief Activation applied to a stored pre-activation value.
 *
 * LeakyReLU clamps at 0.01 from below, it does not scale negative inputs.
 */
template <typename T>
inline T transfer_value(TransferFunction tf, T x) {
    switch (tf) {
        case TransferFunction::Identity: return x;
        case TransferFunction::ReLU: return std::max<T>(x, 0);
        case TransferFunction::LeakyReLU: return std::max<T>(x, T(0.01));
        case TransferFunction::Tanh: return std::tanh(x);
        case TransferFunction::Sigmoid: return T(0.5) + T(0.5) * std::tanh(x * T(0.5));
        case TransferFunction::Sigmoid2: return T(1.7159) * std::tanh(T(0.66666666) * x);
    }
    return x;
}

/**
 * @brief Derivative of transfer_value, evaluated on the same pre-activation.
 */
template <typename T>
inline T transfer_derivative(TransferFunction tf, T x) {
    switch (tf) {
        case TransferFunction::Identity: return T(1);
        case TransferFunction::ReLU: return x > 0 ? T(1) : T(0);
        case TransferFunction::LeakyReLU: return x > 0 ? T(1) : T(0.01);
        case TransferFunction::Tanh: {
            T t = std::tanh(x);
            return T(1) - t * t;
        }
        case TransferFunction::Sigmoid: {
            T t = std::tanh(x * T(0.5));
            return T(0.25) - T(0.25) * t * t;
        }
        case TransferFunction::Sigmoid2: {
            // 1.7159 * 2/3
            const T c = T(1.1427894);
            T t = std::tanh(T(0.66666666) * x);
            return c - c * t * t;
        }
    }
    return T(1);
}

inline std::string transfer_name(TransferFunction tf) {
    switch (tf) {
        case TransferFunction::Identity: return "identity";
        case TransferFunction::ReLU: return "relu";
        case TransferFunction::LeakyReLU: return "leaky_relu";
        case TransferFunction::Tanh: return "tanh";
        case TransferFunction::Sigmoid: return "sigmoid";
        case TransferFunction::Sigmoid2: return "sigmoid2";
    }
    return "identity";
}

inline TransferFunction transfer_from_name(const std::string& name) {
    if (name == "identity") return TransferFunction::Identity;
    if (name == "relu") return TransferFunction::ReLU;
    if (name == "leaky_relu") return TransferFunction::LeakyReLU;
    if (name == "tanh") return TransferFunction::Tanh;
    if (name == "sigmoid") return TransferFunction::Sigmoid;
    if (name == "sigmoid2") return TransferFunction::Sigmoid2;
    throw ModelDeserializationError("Unknown transfer function: " + name);
}

} // namespace layers
} // namespace rpropnet

#endif // RPROPNET_LAYERS_TRANSFERFUNCTION_HPP
