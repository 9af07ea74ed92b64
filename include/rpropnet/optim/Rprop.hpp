#ifndef RPROPNET_OPTIM_RPROP_HPP
#define RPROPNET_OPTIM_RPROP_HPP

#include "../core/Matrix.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace rpropnet {
namespace optim {

using Sign = std::int8_t;

template <typename T>
inline Sign sign_of(T value) {
    if (value > 0) return 1;
    if (value < 0) return -1;
    return 0;
}

/**
 * @brief Resilient backpropagation.
 *
 * Each weight carries its own step size. The step grows while consecutive
 * batch gradients agree in sign and shrinks when they flip; the gradient
 * magnitude is never used. After a flip the weight is left alone for one
 * batch (the stored sign is reset to 0).
 */
template <typename T>
class Rprop {
public:
    static constexpr T kInitialRate = T(0.1);
    static constexpr T kIncrease = T(1.2);
    static constexpr T kDecrease = T(0.5);
    static constexpr T kMaxRate = T(0.01);
    static constexpr T kMinRate = T(0.000001);

    // Applies one step to every weight and zeroes the gradient accumulator.
    void update(Matrix<T>& weights, Matrix<T>& learning_rates,
                Matrix<Sign>& previous_signs, Matrix<T>& gradients) const {
        if (!weights.same_shape(learning_rates) || !weights.same_shape(previous_signs) ||
            !weights.same_shape(gradients)) {
            throw std::invalid_argument("Rprop: per-weight state shape mismatch");
        }

        T* w = weights.data();
        T* r = learning_rates.data();
        Sign* s = previous_signs.data();
        T* g = gradients.data();
        size_t n = weights.size();

        for (size_t i = 0; i < n; ++i) {
            Sign current = sign_of(g[i]);
            int combination = current * s[i];

            if (combination > 0) {
                r[i] = clamp_rate(r[i] * kIncrease);
                w[i] -= r[i] * current;
                s[i] = current;
            } else if (combination < 0) {
                r[i] = clamp_rate(r[i] * kDecrease);
                s[i] = 0;
            } else {
                r[i] = clamp_rate(r[i]);
                w[i] -= r[i] * current;
                s[i] = current;
            }

            g[i] = 0;
        }
    }

private:
    static T clamp_rate(T rate) {
        return std::min(std::max(rate, kMinRate), kMaxRate);
    }
};

} // namespace optim
} // namespace rpropnet

#endif // RPROPNET_OPTIM_RPROP_HPP
