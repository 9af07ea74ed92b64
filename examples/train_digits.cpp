#include <rpropnet/rpropnet.hpp>
#include <rpropnet/data/MnistReader.hpp>
#include <rpropnet/tools/TrainConfig.hpp>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace rpropnet;

static std::uint32_t xorshift(std::uint32_t x) {
    x ^= x << 13;
    x ^= x >> 17;
    return x ^ (x << 5);
}

void test_network(const std::string& filename, data::MnistReader& reader) {
    auto network = Network<double>::load(filename);

    const size_t samples = 1000;
    size_t seen = 0;
    size_t correct = 0;
    double combined_error = 0.0;

    std::uint8_t label = 0;
    std::vector<std::uint8_t> pixels;
    while (seen < samples && reader.next(label, pixels)) {
        std::vector<double> out = network.feedforward(data::normalize_pixels<double>(pixels));

        if (seen == 0) {
            std::cout << "sample output: [";
            for (size_t i = 0; i < out.size(); ++i) std::cout << (i ? ", " : "") << out[i];
            std::cout << "] (correct " << int(label) << ")" << std::endl;
        }

        size_t guess = 0;
        for (size_t i = 1; i < out.size(); ++i) {
            if (out[i] > out[guess]) guess = i;
        }

        for (size_t i = 0; i < out.size(); ++i) {
            double target = (i == label) ? 1.0 : 0.0;
            combined_error += (target - out[i]) * (target - out[i]) * 0.5;
        }

        if (guess == label) correct++;
        seen++;
    }

    double percent = seen == 0 ? 0.0 : (double)correct / seen * 100.0;
    std::cout << "combined error: " << combined_error << ", percent correct: "
              << std::fixed << std::setprecision(2) << percent << "%" << std::endl;
}

void train(const tools::TrainConfig& config, data::MnistReader& reader) {
    const size_t image_size = reader.image_size();

    std::vector<LayerSettings> settings = {
        {50, layers::TransferFunction::Tanh},
        {50, layers::TransferFunction::Tanh},
        {10, layers::TransferFunction::Sigmoid}
    };

    auto network = config.mode == tools::ProgramMode::Restart
        ? Network<double>::create(image_size, settings)
        : Network<double>::load(config.filename);

    if (network.input_size() != image_size) {
        throw ConfigError("model " + config.filename + " expects " + std::to_string(network.input_size()) +
                          " inputs, dataset images have " + std::to_string(image_size));
    }

    std::cout << "Loading " << reader.size() << " training samples..." << std::endl;
    std::vector<TrainSample<double>> dataset;
    dataset.reserve(reader.size());
    {
        std::uint8_t label = 0;
        std::vector<std::uint8_t> pixels;
        while (reader.next(label, pixels)) {
            dataset.push_back(data::to_sample<double>(label, pixels));
        }
    }
    if (dataset.empty()) {
        throw DatasetFormatError("training set is empty");
    }

    // Report roughly 100 times, on a power-of-two stride.
    size_t iterations_progress = config.iterations / 100;
    size_t stride = 1;
    while (iterations_progress > stride) stride <<= 1;
    const size_t progress_mask = stride - 1;
    double progress_counter = 1.0;

    std::random_device rd;
    const size_t batch_begin = xorshift(rd());

    std::cout << "Training for " << config.iterations << " iterations, batch " << config.batch_size
              << ", " << config.threads << " threads" << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<TrainSample<double>> batch(config.batch_size);
    for (size_t i = 0; i < config.iterations; ++i) {
        for (size_t b = 0; b < config.batch_size; ++b) {
            batch[b] = dataset[(i + b + batch_begin) % dataset.size()];
        }
        network.train_on_batch_parallel(batch, config.threads);

        if ((i & progress_mask) == 0) {
            double percent = progress_counter / ((double)config.iterations / stride);
            const int length = 30;
            std::cout << "[";
            for (int p = 0; p < length; ++p) {
                std::cout << (((double)p / length) < percent ? "#" : "_");
            }
            std::cout << "] " << std::fixed << std::setprecision(2) << percent * 100.0 << "%" << std::endl;
            progress_counter += 1.0;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Training took " << elapsed.count() << "s" << std::endl;

    network.save(config.filename);
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    tools::TrainConfig config;
    try {
        config = tools::parse_config(args);
    } catch (const ConfigError& e) {
        std::cerr << "parse error: " << e.what() << std::endl;
        tools::print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (config.show_help) {
        tools::print_usage(std::cout, argv[0]);
        return 1;
    }

    try {
        data::MnistReader train_reader(config.train_labels, config.train_images);
        train(config, train_reader);

        data::MnistReader test_reader(config.test_labels, config.test_images);
        test_network(config.filename, test_reader);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
