#include <rpropnet/tools/TrainConfig.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace rpropnet;
using tools::ProgramMode;

template <typename Fn>
static bool rejects(Fn fn) {
    try {
        fn();
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void test_defaults() {
    std::cout << "Testing Config Defaults..." << std::endl;
    auto config = tools::parse_config({"-i", "train-images", "-l", "train-labels"});
    assert(config.mode == ProgramMode::Restart);
    assert(config.filename == "network.nn");
    assert(config.threads >= 1);
    assert(config.iterations == 10);
    assert(config.batch_size == 10000);
    assert(config.train_images == "train-images");
    assert(config.train_labels == "train-labels");
    assert(config.test_images == "train-images");
    assert(config.test_labels == "train-labels");
    assert(!config.show_help);
    std::cout << "PASS" << std::endl;
}

void test_all_flags() {
    std::cout << "Testing Config Flags..." << std::endl;
    auto config = tools::parse_config({
        "--mode", "train", "--output", "digits.nn", "--threads", "3", "-I", "250", "-b", "64",
        "--images", "a", "--labels", "b", "-t", "c", "-T", "d"
    });
    assert(config.mode == ProgramMode::Train);
    assert(config.filename == "digits.nn");
    assert(config.threads == 3);
    assert(config.iterations == 250);
    assert(config.batch_size == 64);
    assert(config.test_images == "c");
    assert(config.test_labels == "d");

    assert(tools::parse_config({"-h"}).show_help);
    std::cout << "PASS" << std::endl;
}

void test_errors() {
    std::cout << "Testing Config Errors..." << std::endl;
    assert(rejects([] { tools::parse_config({"-i", "a"}); }));
    assert(rejects([] { tools::parse_config({"-l", "b"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "--bogus"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-b"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-M", "resume"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "--threads", "many"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "--threads", "0"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-I", "-4"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-I", "12x"}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-I", ""}); }));
    assert(rejects([] { tools::parse_config({"-i", "a", "-l", "b", "-I", "+4"}); }));

    // Leading whitespace must not let a negative count wrap around.
    assert(rejects([] { tools::parse_config({"-l", "a", "-i", "b", "--threads", " -5"}); }));
    assert(rejects([] { tools::parse_config({"-l", "a", "-i", "b", "-b", " -1"}); }));
    assert(rejects([] { tools::parse_config({"-l", "a", "-i", "b", "-b", " 7"}); }));
    assert(rejects([] { tools::parse_config({"-l", "a", "-i", "b", "-b", "\t-1"}); }));
    std::cout << "PASS" << std::endl;
}

int main() {
    test_defaults();
    test_all_flags();
    test_errors();
    std::cout << "All Config tests passed!" << std::endl;
    return 0;
}
