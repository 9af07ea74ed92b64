#ifndef RPROPNET_TOOLS_TRAINCONFIG_HPP
#define RPROPNET_TOOLS_TRAINCONFIG_HPP

#include <cctype>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../core/Errors.hpp"

namespace rpropnet {
namespace tools {

enum class ProgramMode {
    Restart,
    Train
};

struct TrainConfig {
    ProgramMode mode = ProgramMode::Restart;
    std::string filename = "network.nn";
    size_t threads = 1;
    size_t iterations = 10;
    size_t batch_size = 10000;
    std::string train_images;
    std::string train_labels;
    std::string test_images;
    std::string test_labels;
    bool show_help = false;
};

inline size_t default_thread_count() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

// Plain decimal digits only, no sign or leading whitespace.
inline size_t parse_count(const std::string& flag, const std::string& value) {
    if (value.empty() || value.find('-') != std::string::npos ||
        !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw ConfigError("invalid value (" + flag + " " + value + ")");
    }

    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid value (" + flag + " " + value + ")");
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid value (" + flag + " " + value + ")");
    }
    return static_cast<size_t>(parsed);
}

// args excludes the program name. Throws ConfigError.
inline TrainConfig parse_config(const std::vector<std::string>& args) {
    TrainConfig config;
    config.threads = default_thread_count();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigError("argument value missing (" + arg + ")");
            }
            return args[++i];
        };

        if (arg == "-M" || arg == "--mode") {
            const std::string& mode = value();
            if (mode == "restart") config.mode = ProgramMode::Restart;
            else if (mode == "train") config.mode = ProgramMode::Train;
            else throw ConfigError("invalid value (" + mode + ")");
        }
        else if (arg == "-o" || arg == "--output") config.filename = value();
        else if (arg == "--threads") config.threads = parse_count(arg, value());
        else if (arg == "-I" || arg == "--iter") config.iterations = parse_count(arg, value());
        else if (arg == "-b" || arg == "--batch") config.batch_size = parse_count(arg, value());
        else if (arg == "-i" || arg == "--images") config.train_images = value();
        else if (arg == "-l" || arg == "--labels") config.train_labels = value();
        else if (arg == "-t" || arg == "--test-images") config.test_images = value();
        else if (arg == "-T" || arg == "--test-labels") config.test_labels = value();
        else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        }
        else throw ConfigError("invalid argument (" + arg + ")");
    }

    if (config.train_labels.empty()) throw ConfigError("missing required argument (--labels)");
    if (config.train_images.empty()) throw ConfigError("missing required argument (--images)");
    if (config.threads == 0) throw ConfigError("invalid value (--threads 0)");
    if (config.batch_size == 0) throw ConfigError("invalid value (--batch 0)");

    if (config.test_images.empty()) config.test_images = config.train_images;
    if (config.test_labels.empty()) config.test_labels = config.train_labels;

    return config;
}

inline void print_usage(std::ostream& out, const std::string& program) {
    out << "usage: " << program << " [args]\n"
        << "args:\n"
        << "    -h, --help         display this help message\n"
        << "    -M, --mode         program mode (default restart)\n"
        << "    -o, --output       output filename (default network.nn)\n"
        << "    --threads          override the amount of threads used\n"
        << "    -I, --iter         iterations to train for (default 10)\n"
        << "    -b, --batch        batch size (default 10000)\n"
        << "    -i, --images       mnist training images\n"
        << "    -l, --labels       mnist training labels\n"
        << "    -t, --test-images  optional test images (uses training otherwise)\n"
        << "    -T, --test-labels  optional test labels (uses training otherwise)\n"
        << "program modes:\n"
        << "    restart, train" << std::endl;
}

} // namespace tools
} // namespace rpropnet

#endif // RPROPNET_TOOLS_TRAINCONFIG_HPP
