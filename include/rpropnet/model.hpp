#ifndef RPROPNET_MODEL_HPP
#define RPROPNET_MODEL_HPP

#include <exception>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/Errors.hpp"
#include "layers/Dense.hpp"

namespace rpropnet {

template <typename T>
struct TrainSample {
    std::vector<T> inputs;
    std::vector<T> outputs;
};

struct LayerSettings {
    size_t size;
    layers::TransferFunction transfer_function;
};

namespace detail {

// Joins every still joinable thread on scope exit, including during unwinding.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() { join(); }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
    }

private:
    std::vector<std::thread>& threads_;
};

} // namespace detail

/**
 * @brief A fixed chain of dense layers trained with batch RPROP.
 *
 * Layer i consumes the transformed output of layer i-1 (or the raw inputs for
 * layer 0). Gradients are accumulated over a whole batch and applied once.
 */
template <typename T>
class Network {
public:
    using Layer = layers::Dense<T>;
    using Sample = TrainSample<T>;

    // Throws ContractViolation if no layers are given or a size is zero.
    static Network create(size_t inputs_amount, const std::vector<LayerSettings>& settings) {
        std::random_device rd;
        std::mt19937 gen(rd());
        return create(inputs_amount, settings, gen);
    }

    template <typename Gen>
    static Network create(size_t inputs_amount, const std::vector<LayerSettings>& settings, Gen& gen) {
        if (settings.empty()) {
            throw ContractViolation("Network: at least one layer is required");
        }
        if (inputs_amount == 0) {
            throw ContractViolation("Network: input size must be positive");
        }

        std::vector<Layer> chain;
        chain.reserve(settings.size());
        size_t previous_size = inputs_amount;
        for (const auto& layer : settings) {
            if (layer.size == 0) {
                throw ContractViolation("Network: layer size must be positive");
            }
            chain.emplace_back(layer.size, previous_size, layer.transfer_function, gen);
            previous_size = layer.size;
        }

        return Network(inputs_amount, std::move(chain));
    }

    // Takes ownership of already built layers; the size chain must be consistent.
    Network(size_t inputs_amount, std::vector<Layer> layers)
        : inputs_amount_(inputs_amount), layers_(std::move(layers))
    {
        if (layers_.empty()) {
            throw std::invalid_argument("Network: at least one layer is required");
        }
        size_t previous_size = inputs_amount_;
        for (size_t i = 0; i < layers_.size(); ++i) {
            if (layers_[i].previous_size() != previous_size) {
                throw std::invalid_argument("Network: layer " + std::to_string(i) +
                                            " expects " + std::to_string(layers_[i].previous_size()) +
                                            " inputs but receives " + std::to_string(previous_size));
            }
            previous_size = layers_[i].size();
        }
    }

    // Returns the final layer's outputs with its transfer function applied.
    std::vector<T> feedforward(const std::vector<T>& inputs) {
        feedforward_inner(inputs);
        return layers_.back().transformed_activations();
    }

    void train_on_batch(const std::vector<Sample>& samples) {
        accumulate(samples.begin(), samples.end());
        apply_gradients();
    }

    /**
     * @brief Batch training split across worker threads.
     *
     * worker_count - 1 contiguous chunks are processed by private copies of
     * the network on their own threads, the calling thread handles the rest
     * on this network. After every worker has joined, the copies' gradients
     * are merged in spawn order and applied once, so the result matches
     * train_on_batch up to floating point summation order.
     *
     * An exception in any worker, or a failure to start one, aborts the step
     * after all started threads joined; nothing is merged or applied.
     */
    void train_on_batch_parallel(const std::vector<Sample>& samples, size_t worker_count) {
        if (worker_count <= 1 || samples.size() < worker_count) {
            train_on_batch(samples);
            return;
        }

        const size_t per_worker = samples.size() / worker_count;
        const size_t spawned = worker_count - 1;

        std::vector<Network> replicas(spawned, *this);
        std::vector<std::exception_ptr> errors(spawned);
        std::vector<std::thread> workers;
        workers.reserve(spawned);
        detail::ThreadJoiner joiner(workers);

        auto chunk_begin = samples.begin();
        for (size_t w = 0; w < spawned; ++w) {
            auto chunk_end = chunk_begin + per_worker;
            Network& replica = replicas[w];
            replica.reset_temporary();
            std::exception_ptr& error = errors[w];
            workers.emplace_back([&replica, &error, chunk_begin, chunk_end]() {
                try {
                    replica.accumulate(chunk_begin, chunk_end);
                } catch (...) {
                    error = std::current_exception();
                }
            });
            chunk_begin = chunk_end;
        }

        std::exception_ptr local_error;
        try {
            accumulate(chunk_begin, samples.end());
        } catch (...) {
            local_error = std::current_exception();
        }

        joiner.join();

        if (local_error) std::rethrow_exception(local_error);
        for (const auto& error : errors) {
            if (error) std::rethrow_exception(error);
        }

        for (const auto& replica : replicas) {
            combine(replica);
        }
        apply_gradients();
    }

    // Forward and backward over [first, last), adding into the gradient accumulators.
    template <typename Iterator>
    void accumulate(Iterator first, Iterator last) {
        for (; first != last; ++first) {
            feedforward_inner(first->inputs);
            backpropagate_inner(first->inputs, first->outputs);
        }
    }

    void accumulate(const std::vector<Sample>& samples) {
        accumulate(samples.begin(), samples.end());
    }

    void apply_gradients() {
        for (auto& layer : layers_) {
            layer.apply_gradients();
        }
    }

    // Merges another replica's accumulated gradients layer by layer.
    void combine(const Network& other) {
        if (other.layers_.size() != layers_.size()) {
            throw std::invalid_argument("Network: cannot combine networks with different depth");
        }
        for (size_t i = 0; i < layers_.size(); ++i) {
            layers_[i].combine(other.layers_[i]);
        }
    }

    void reset_temporary() {
        for (auto& layer : layers_) {
            layer.reset_temporary();
        }
    }

    // Defined in io/Serializer.hpp.
    void save(const std::string& filepath) const;
    static Network load(const std::string& filepath);

    size_t input_size() const { return inputs_amount_; }
    size_t output_size() const { return layers_.back().size(); }
    const std::vector<Layer>& layers() const { return layers_; }
    std::vector<Layer>& layers() { return layers_; }

    // Runs forward only; the final layer keeps raw pre-activation sums.
    void feedforward_inner(const std::vector<T>& inputs) {
        if (inputs.size() != inputs_amount_) {
            throw std::invalid_argument("Network: expected " + std::to_string(inputs_amount_) +
                                        " inputs, got " + std::to_string(inputs.size()));
        }

        layers_[0].forward(inputs, layers::TransferFunction::Identity);
        for (size_t i = 1; i < layers_.size(); ++i) {
            const Layer& previous = layers_[i - 1];
            layers_[i].forward(previous.activations(), previous.transfer_function());
        }
    }

    // Requires a preceding feedforward_inner on the same inputs.
    void backpropagate_inner(const std::vector<T>& inputs, const std::vector<T>& outputs) {
        const size_t last = layers_.size() - 1;
        for (size_t l = layers_.size(); l-- > 0;) {
            std::vector<T> layer_inputs = l == 0 ? inputs : layers_[l - 1].transformed_activations();

            if (l == last) {
                layers_[l].backward(layer_inputs, layers::BackwardSource<T>::outputs(outputs));
            } else {
                const Layer& next = layers_[l + 1];
                layers_[l].backward(layer_inputs,
                                    layers::BackwardSource<T>::inner(next.local_gradients(), next.weights()));
            }
        }
    }

private:
    size_t inputs_amount_;
    std::vector<Layer> layers_;
};

} // namespace rpropnet

#include "io/Serializer.hpp"

#endif // RPROPNET_MODEL_HPP
