#include <rpropnet/rpropnet.hpp>
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace rpropnet;
using layers::TransferFunction;

template <typename T>
void check_shapes(const layers::Dense<T>& layer, size_t size, size_t previous_size) {
    assert(layer.size() == size);
    assert(layer.previous_size() == previous_size);
    assert(layer.weights().rows() == size);
    assert(layer.weights().cols() == previous_size + 1);
    assert(layer.learning_rates().same_shape(layer.weights()));
    assert(layer.previous_signs().same_shape(layer.weights()));
    assert(layer.gradients().same_shape(layer.weights()));
    assert(layer.activations().size() == size);
    assert(layer.local_gradients().size() == size);
}

void test_network_shapes() {
    std::cout << "Testing Network Shape Invariants..." << std::endl;
    std::mt19937 gen(7);
    auto net = Network<double>::create(5, {
        {4, TransferFunction::Tanh},
        {3, TransferFunction::ReLU},
        {2, TransferFunction::Sigmoid}
    }, gen);

    assert(net.input_size() == 5);
    assert(net.output_size() == 2);
    assert(net.layers().size() == 3);
    check_shapes(net.layers()[0], 4, 5);
    check_shapes(net.layers()[1], 3, 4);
    check_shapes(net.layers()[2], 2, 3);

    // Shapes survive training.
    std::vector<TrainSample<double>> batch = {
        {{0.1, 0.2, 0.3, 0.4, 0.5}, {1.0, 0.0}},
        {{0.5, 0.4, 0.3, 0.2, 0.1}, {0.0, 1.0}}
    };
    net.train_on_batch(batch);
    check_shapes(net.layers()[0], 4, 5);
    check_shapes(net.layers()[1], 3, 4);
    check_shapes(net.layers()[2], 2, 3);
    std::cout << "PASS" << std::endl;
}

void test_fresh_layer_state() {
    std::cout << "Testing Fresh Layer State..." << std::endl;
    std::mt19937 gen(11);
    layers::Dense<double> layer(6, 9, TransferFunction::Tanh, gen);

    for (size_t i = 0; i < layer.size(); ++i) {
        for (size_t j = 0; j < layer.weights().cols(); ++j) {
            double w = layer.weights()(i, j);
            assert(w >= -1.0 && w < 1.0);
            assert(layer.previous_signs()(i, j) == optim::sign_of(w));
            assert(layer.learning_rates()(i, j) == 0.1);
            assert(layer.gradients()(i, j) == 0.0);
        }
    }
    std::cout << "PASS" << std::endl;
}

void test_zero_input_gives_bias() {
    std::cout << "Testing Zero Input Determinism..." << std::endl;
    std::vector<TransferFunction> tfs = {
        TransferFunction::Identity, TransferFunction::ReLU, TransferFunction::LeakyReLU,
        TransferFunction::Tanh, TransferFunction::Sigmoid, TransferFunction::Sigmoid2
    };
    for (auto tf : tfs) {
        auto net = Network<double>::create(8, {{5, tf}});
        std::vector<double> out = net.feedforward(std::vector<double>(8, 0.0));
        const auto& w = net.layers()[0].weights();
        assert(out.size() == 5);
        for (size_t i = 0; i < out.size(); ++i) {
            assert(out[i] == layers::transfer_value(tf, w(i, 8)));
        }
    }
    std::cout << "PASS" << std::endl;
}

void test_forward_applies_previous_transfer() {
    std::cout << "Testing Forward Uses Previous Transfer Function..." << std::endl;
    Matrix<double> w = Matrix<double>::from_rows({{2.0, -1.0, 0.5}});
    Matrix<double> r(1, 3, 0.1);
    Matrix<optim::Sign> s(1, 3);
    layers::Dense<double> layer(w, r, s, TransferFunction::Identity);

    layer.forward({-3.0, 4.0}, TransferFunction::ReLU);
    // relu(-3)*2 + relu(4)*-1 + 0.5
    assert(std::abs(layer.activations()[0] - (-3.5)) < 1e-12);
    std::cout << "PASS" << std::endl;
}

void test_backward_output_layer() {
    std::cout << "Testing Output Layer Backward..." << std::endl;
    Matrix<double> w = Matrix<double>::from_rows({{0.5, -0.25, 0.1}});
    layers::Dense<double> layer(w, Matrix<double>(1, 3, 0.1), Matrix<optim::Sign>(1, 3), TransferFunction::Identity);

    std::vector<double> inputs = {2.0, 4.0};
    layer.forward(inputs, TransferFunction::Identity);
    // 1.0 - 1.0 + 0.1
    assert(std::abs(layer.activations()[0] - 0.1) < 1e-12);

    std::vector<double> expected = {1.1};
    layer.backward(inputs, layers::BackwardSource<double>::outputs(expected));
    // error = 0.1 - 1.1 = -1, identity derivative 1
    assert(std::abs(layer.local_gradients()[0] - (-1.0)) < 1e-12);
    assert(std::abs(layer.gradients()(0, 0) - (-2.0)) < 1e-12);
    assert(std::abs(layer.gradients()(0, 1) - (-4.0)) < 1e-12);
    assert(std::abs(layer.gradients()(0, 2) - (-1.0)) < 1e-12);
    // The forward value is kept alongside the local gradient.
    assert(std::abs(layer.activations()[0] - 0.1) < 1e-12);

    // A second sample accumulates.
    layer.forward(inputs, TransferFunction::Identity);
    layer.backward(inputs, layers::BackwardSource<double>::outputs(expected));
    assert(std::abs(layer.gradients()(0, 2) - (-2.0)) < 1e-12);
    std::cout << "PASS" << std::endl;
}

void test_combine_adds_gradients() {
    std::cout << "Testing Layer Combine..." << std::endl;
    std::mt19937 gen(3);
    layers::Dense<double> a(2, 2, TransferFunction::Tanh, gen);
    layers::Dense<double> b = a;
    Matrix<double> weights_before = a.weights();

    a.gradients().fill(1.5);
    b.gradients().fill(0.25);
    a.combine(b);
    for (size_t i = 0; i < a.gradients().size(); ++i) {
        assert(a.gradients().data()[i] == 1.75);
    }
    assert(a.weights() == weights_before);

    layers::Dense<double> other(3, 2, TransferFunction::Tanh, gen);
    bool threw = false;
    try {
        a.combine(other);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

void test_contract_violations() {
    std::cout << "Testing Construction Contract..." << std::endl;
    bool threw = false;
    try {
        Network<double>::create(3, {});
    } catch (const ContractViolation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Network<double>::create(3, {{0, TransferFunction::Tanh}});
    } catch (const ContractViolation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    auto net = Network<double>::create(3, {{2, TransferFunction::Tanh}});
    try {
        net.feedforward({1.0, 2.0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        layers::Dense<double> bad(Matrix<double>(2, 3), Matrix<double>(2, 2), Matrix<optim::Sign>(2, 3),
                                  TransferFunction::Tanh);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

int main() {
    test_network_shapes();
    test_fresh_layer_state();
    test_zero_input_gives_bias();
    test_forward_applies_previous_transfer();
    test_backward_output_layer();
    test_combine_adds_gradients();
    test_contract_violations();
    std::cout << "All Dense tests passed!" << std::endl;
    return 0;
}
