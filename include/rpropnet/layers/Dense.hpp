#ifndef RPROPNET_LAYERS_DENSE_HPP
#define RPROPNET_LAYERS_DENSE_HPP

#include "TransferFunction.hpp"
#include "../core/Matrix.hpp"
#include "../optim/Rprop.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

namespace rpropnet {
namespace layers {

/**
 * @brief Where a layer's per-neuron error comes from during backward.
 *
 * The output layer compares against the expected outputs. Every other layer
 * reads the local gradients and weights of the layer after it.
 */
template <typename T>
struct BackwardSource {
    const std::vector<T>* expected = nullptr;
    const std::vector<T>* next_local_gradients = nullptr;
    const Matrix<T>* next_weights = nullptr;

    static BackwardSource outputs(const std::vector<T>& expected) {
        BackwardSource source;
        source.expected = &expected;
        return source;
    }

    static BackwardSource inner(const std::vector<T>& next_local_gradients, const Matrix<T>& next_weights) {
        BackwardSource source;
        source.next_local_gradients = &next_local_gradients;
        source.next_weights = &next_weights;
        return source;
    }

    bool is_output() const { return expected != nullptr; }
};

/**
 * @brief Fully connected layer trained with RPROP.
 *
 * Weights are stored as (neurons, previous + 1); the last column is the bias.
 * Learning rates, previous gradient signs and the batch gradient accumulator
 * share that shape.
 *
 * The layer stores raw pre-activation sums. Its transfer function is applied
 * lazily by whoever reads them: the next layer's forward, or the caller for
 * the final layer.
 */
template <typename T>
class Dense {
public:
    template <typename Gen>
    Dense(size_t size, size_t previous_size, TransferFunction transfer_function, Gen& gen)
        : previous_size_(previous_size), transfer_function_(transfer_function),
          weights_(size, previous_size + 1), learning_rates_(size, previous_size + 1),
          previous_signs_(size, previous_size + 1), gradients_(size, previous_size + 1)
    {
        weights_.random_uniform(T(-1), T(1), gen);
        learning_rates_.fill(optim::Rprop<T>::kInitialRate);

        const T* w = weights_.data();
        optim::Sign* s = previous_signs_.data();
        for (size_t i = 0; i < weights_.size(); ++i) {
            s[i] = optim::sign_of(w[i]);
        }

        reset_temporary();
    }

    // Restores a layer from persisted state.
    Dense(Matrix<T> weights, Matrix<T> learning_rates, Matrix<optim::Sign> previous_signs,
          TransferFunction transfer_function)
        : transfer_function_(transfer_function), weights_(std::move(weights)),
          learning_rates_(std::move(learning_rates)), previous_signs_(std::move(previous_signs))
    {
        if (weights_.rows() == 0 || weights_.cols() == 0) {
            throw std::invalid_argument("Dense: weight matrix must have at least one row and the bias column");
        }
        if (!weights_.same_shape(learning_rates_) || !weights_.same_shape(previous_signs_)) {
            throw std::invalid_argument("Dense: learning rate and sign matrices must match the weight shape");
        }
        previous_size_ = weights_.cols() - 1;
        reset_temporary();
    }

    // Zeroes the neuron buffers and the gradient accumulator, sized from the weights.
    void reset_temporary() {
        activations_.assign(weights_.rows(), T(0));
        local_gradients_.assign(weights_.rows(), T(0));
        gradients_ = Matrix<T>(weights_.rows(), weights_.cols());
    }

    void forward(const std::vector<T>& previous, TransferFunction previous_transfer_function) {
        if (previous.size() != previous_size_) {
            throw std::invalid_argument("Dense: input size mismatch in forward");
        }

        for (size_t i = 0; i < weights_.rows(); ++i) {
            const T* w = weights_.row(i);
            T sum = 0;
            for (size_t j = 0; j < previous_size_; ++j) {
                sum += transfer_value(previous_transfer_function, previous[j]) * w[j];
            }
            activations_[i] = sum + w[previous_size_];
        }
    }

    // inputs are this layer's inputs with the previous transfer function already applied.
    void backward(const std::vector<T>& inputs, const BackwardSource<T>& source) {
        if (inputs.size() != previous_size_) {
            throw std::invalid_argument("Dense: input size mismatch in backward");
        }
        if (source.is_output()) {
            if (source.expected->size() != size()) {
                throw std::invalid_argument("Dense: expected output size mismatch");
            }
        } else if (source.next_weights->cols() != size() + 1 ||
                   source.next_local_gradients->size() != source.next_weights->rows()) {
            throw std::invalid_argument("Dense: next layer does not chain onto this one");
        }

        for (size_t i = 0; i < weights_.rows(); ++i) {
            T error = 0;
            if (source.is_output()) {
                error = transfer_value(transfer_function_, activations_[i]) - (*source.expected)[i];
            } else {
                const std::vector<T>& next_local = *source.next_local_gradients;
                const Matrix<T>& next_weights = *source.next_weights;
                for (size_t k = 0; k < next_local.size(); ++k) {
                    error += next_local[k] * next_weights(k, i);
                }
            }

            T local = transfer_derivative(transfer_function_, activations_[i]) * error;

            T* g = gradients_.row(i);
            RPROPNET_SIMD_LOOP
            for (size_t j = 0; j < previous_size_; ++j) {
                g[j] += local * inputs[j];
            }
            g[previous_size_] += local;

            local_gradients_[i] = local;
        }
    }

    void apply_gradients() {
        rprop_.update(weights_, learning_rates_, previous_signs_, gradients_);
    }

    // Adds another replica's accumulated gradients into ours. Weights are untouched.
    void combine(const Dense& other) {
        gradients_ += other.gradients_;
    }

    size_t size() const { return weights_.rows(); }
    size_t previous_size() const { return previous_size_; }
    TransferFunction transfer_function() const { return transfer_function_; }

    const Matrix<T>& weights() const { return weights_; }
    Matrix<T>& weights() { return weights_; }
    const Matrix<T>& learning_rates() const { return learning_rates_; }
    const Matrix<optim::Sign>& previous_signs() const { return previous_signs_; }
    const Matrix<T>& gradients() const { return gradients_; }
    Matrix<T>& gradients() { return gradients_; }

    const std::vector<T>& activations() const { return activations_; }
    const std::vector<T>& local_gradients() const { return local_gradients_; }

    std::vector<T> transformed_activations() const {
        std::vector<T> result(activations_.size());
        for (size_t i = 0; i < activations_.size(); ++i) {
            result[i] = transfer_value(transfer_function_, activations_[i]);
        }
        return result;
    }

private:
    size_t previous_size_ = 0;
    TransferFunction transfer_function_ = TransferFunction::Identity;

    Matrix<T> weights_;
    Matrix<T> learning_rates_;
    Matrix<optim::Sign> previous_signs_;
    Matrix<T> gradients_;

    // Transient, never persisted.
    std::vector<T> activations_;
    std::vector<T> local_gradients_;

    optim::Rprop<T> rprop_;
};

} // namespace layers
} // namespace rpropnet

#endif // RPROPNET_LAYERS_DENSE_HPP
