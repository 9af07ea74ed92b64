#include "rpropnet/infer/Recognize.hpp"

#include <exception>
#include <iostream>
#include <vector>

#include "rpropnet/data/MnistReader.hpp"
#include "rpropnet/model.hpp"

extern "C" rpropnet_guesses rpropnet_recognize(const char* model_path, const unsigned char* image) {
    rpropnet_guesses result = {};
    if (model_path == nullptr || image == nullptr) {
        return result;
    }

    try {
        auto network = rpropnet::Network<double>::load(model_path);
        if (network.input_size() != RPROPNET_RECOGNIZE_WIDTH * RPROPNET_RECOGNIZE_HEIGHT ||
            network.output_size() != RPROPNET_RECOGNIZE_CLASSES) {
            std::cerr << "rpropnet_recognize: model " << model_path << " is not a "
                      << RPROPNET_RECOGNIZE_WIDTH << "x" << RPROPNET_RECOGNIZE_HEIGHT << " digit classifier" << std::endl;
            return result;
        }

        std::vector<unsigned char> pixels(image, image + RPROPNET_RECOGNIZE_WIDTH * RPROPNET_RECOGNIZE_HEIGHT);
        std::vector<double> outputs = network.feedforward(rpropnet::data::normalize_pixels<double>(pixels));
        for (size_t i = 0; i < outputs.size(); ++i) {
            result.guesses[i] = outputs[i];
        }
    } catch (const std::exception& e) {
        std::cerr << "rpropnet_recognize: " << e.what() << " (filepath: " << model_path << ")" << std::endl;
        rpropnet_guesses empty = {};
        return empty;
    }

    return result;
}
