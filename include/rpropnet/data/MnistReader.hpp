#ifndef RPROPNET_DATA_MNISTREADER_HPP
#define RPROPNET_DATA_MNISTREADER_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "../core/Errors.hpp"
#include "../model.hpp"

namespace rpropnet {
namespace data {

/**
 * @brief Streaming reader for an IDX label file and its matching image file.
 *
 * Labels: magic 2049, count, then one byte per label.
 * Images: magic 2051, count, rows, cols, then rows*cols bytes per image.
 * All header words are big-endian. Pairs are yielded in file order, once.
 */
class MnistReader {
public:
    static constexpr std::uint32_t kLabelsMagic = 2049;
    static constexpr std::uint32_t kImagesMagic = 2051;

    MnistReader(const std::string& labels_path, const std::string& images_path)
        : labels_(labels_path, std::ios::binary), images_(images_path, std::ios::binary)
    {
        if (!labels_.is_open()) {
            throw DatasetFormatError("MnistReader: can't open label file " + labels_path);
        }
        if (!images_.is_open()) {
            throw DatasetFormatError("MnistReader: can't open image file " + images_path);
        }

        if (read_big_endian(labels_, labels_path) != kLabelsMagic) {
            throw DatasetFormatError("MnistReader: bad magic number in " + labels_path);
        }
        size_t label_count = read_big_endian(labels_, labels_path);

        if (read_big_endian(images_, images_path) != kImagesMagic) {
            throw DatasetFormatError("MnistReader: bad magic number in " + images_path);
        }
        size_t image_count = read_big_endian(images_, images_path);
        height_ = read_big_endian(images_, images_path);
        width_ = read_big_endian(images_, images_path);

        if (label_count != image_count) {
            throw DatasetFormatError("MnistReader: " + std::to_string(label_count) + " labels but " +
                                     std::to_string(image_count) + " images");
        }
        count_ = label_count;
    }

    size_t size() const { return count_; }
    std::uint32_t width() const { return width_; }
    std::uint32_t height() const { return height_; }
    size_t image_size() const { return static_cast<size_t>(width_) * height_; }

    // Reads the next pair. Returns false once every pair has been consumed.
    bool next(std::uint8_t& label, std::vector<std::uint8_t>& pixels) {
        if (index_ >= count_) return false;

        char byte = 0;
        if (!labels_.read(&byte, 1)) {
            throw DatasetFormatError("MnistReader: label file truncated at entry " + std::to_string(index_));
        }
        label = static_cast<std::uint8_t>(byte);

        pixels.resize(image_size());
        if (!images_.read(reinterpret_cast<char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()))) {
            throw DatasetFormatError("MnistReader: image file truncated at entry " + std::to_string(index_));
        }

        ++index_;
        return true;
    }

    // Collects up to limit remaining pairs.
    std::vector<std::pair<std::uint8_t, std::vector<std::uint8_t>>> read_all(size_t limit = SIZE_MAX) {
        std::vector<std::pair<std::uint8_t, std::vector<std::uint8_t>>> result;
        std::uint8_t label = 0;
        std::vector<std::uint8_t> pixels;
        while (result.size() < limit && next(label, pixels)) {
            result.emplace_back(label, pixels);
        }
        return result;
    }

private:
    static std::uint32_t read_big_endian(std::ifstream& fs, const std::string& path) {
        unsigned char buff[4];
        if (!fs.read(reinterpret_cast<char*>(buff), 4)) {
            throw DatasetFormatError("MnistReader: header of " + path + " is truncated");
        }
        return (std::uint32_t(buff[0]) << 24) | (std::uint32_t(buff[1]) << 16) |
               (std::uint32_t(buff[2]) << 8) | std::uint32_t(buff[3]);
    }

    std::ifstream labels_;
    std::ifstream images_;
    size_t count_ = 0;
    size_t index_ = 0;
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
};

// Pixels scaled to [0, 1].
template <typename T>
std::vector<T> normalize_pixels(const std::vector<std::uint8_t>& pixels) {
    std::vector<T> result(pixels.size());
    for (size_t i = 0; i < pixels.size(); ++i) {
        result[i] = static_cast<T>(pixels[i]) / T(255);
    }
    return result;
}

// Scaled pixels as inputs, one-hot label as expected outputs.
template <typename T>
TrainSample<T> to_sample(std::uint8_t label, const std::vector<std::uint8_t>& pixels, size_t classes = 10) {
    TrainSample<T> sample;
    sample.inputs = normalize_pixels<T>(pixels);
    sample.outputs.assign(classes, T(0));
    if (label < classes) sample.outputs[label] = T(1);
    return sample;
}

} // namespace data
} // namespace rpropnet

#endif // RPROPNET_DATA_MNISTREADER_HPP
