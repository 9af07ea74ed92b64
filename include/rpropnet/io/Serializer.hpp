#ifndef RPROPNET_IO_SERIALIZER_HPP
#define RPROPNET_IO_SERIALIZER_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/Errors.hpp"
#include "../model.hpp"

namespace rpropnet {
namespace io {

/**
 * @brief Model persistence through CBOR.
 *
 * Document layout:
 *   { "inputs_amount": n,
 *     "layers": [ { "weights": [[..]], "learning_rates": [[..]],
 *                   "previous_signs": [[..]], "transfer_function": "tanh" }, .. ] }
 *
 * Gradient accumulators and neuron buffers are never written; they come back
 * zeroed with the right shape on load.
 */
class Serializer {
public:
    template <typename T>
    static std::vector<std::uint8_t> to_cbor(const Network<T>& network) {
        nlohmann::json doc;
        doc["inputs_amount"] = network.input_size();

        nlohmann::json layer_docs = nlohmann::json::array();
        for (const auto& layer : network.layers()) {
            nlohmann::json entry;
            entry["weights"] = layer.weights().to_rows();
            entry["learning_rates"] = layer.learning_rates().to_rows();

            // int8_t rows would round-trip as characters otherwise.
            std::vector<std::vector<int>> signs(layer.size());
            for (size_t i = 0; i < layer.size(); ++i) {
                const auto* row = layer.previous_signs().row(i);
                signs[i].assign(row, row + layer.previous_signs().cols());
            }
            entry["previous_signs"] = signs;
            entry["transfer_function"] = layers::transfer_name(layer.transfer_function());
            layer_docs.push_back(std::move(entry));
        }
        doc["layers"] = std::move(layer_docs);

        return nlohmann::json::to_cbor(doc);
    }

    // Throws ModelDeserializationError on malformed or inconsistent input.
    template <typename T>
    static Network<T> from_cbor(const std::vector<std::uint8_t>& bytes) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::from_cbor(bytes);
        } catch (const nlohmann::json::exception& e) {
            throw ModelDeserializationError(std::string("Serializer: invalid CBOR: ") + e.what());
        }

        try {
            if (!doc.is_object() || !doc.contains("inputs_amount") || !doc.contains("layers")) {
                throw ModelDeserializationError("Serializer: missing inputs_amount or layers");
            }
            if (!doc["inputs_amount"].is_number_unsigned()) {
                throw ModelDeserializationError("Serializer: inputs_amount must be an unsigned integer");
            }
            const auto& layers_doc = doc["layers"];
            if (!layers_doc.is_array() || layers_doc.empty()) {
                throw ModelDeserializationError("Serializer: layers must be a non-empty array");
            }

            size_t inputs_amount = doc["inputs_amount"].get<size_t>();
            if (inputs_amount == 0) {
                throw ModelDeserializationError("Serializer: inputs_amount must be positive");
            }
            std::vector<layers::Dense<T>> chain;
            chain.reserve(layers_doc.size());

            for (const auto& entry : layers_doc) {
                auto weights = Matrix<T>::from_rows(entry.at("weights").get<std::vector<std::vector<T>>>());
                auto rates = Matrix<T>::from_rows(entry.at("learning_rates").get<std::vector<std::vector<T>>>());
                const auto& sign_rows = entry.at("previous_signs");
                if (!sign_rows.is_array()) {
                    throw ModelDeserializationError("Serializer: previous_signs must be an array of rows");
                }

                std::vector<std::vector<optim::Sign>> narrowed(sign_rows.size());
                for (size_t i = 0; i < sign_rows.size(); ++i) {
                    if (!sign_rows[i].is_array()) {
                        throw ModelDeserializationError("Serializer: previous_signs must be an array of rows");
                    }
                    for (const auto& cell : sign_rows[i]) {
                        if (!cell.is_number_integer()) {
                            throw ModelDeserializationError("Serializer: previous sign is not an integer");
                        }
                        // Unsigned values above INT64_MAX are out of range too.
                        if (cell.is_number_unsigned() && cell.get<std::uint64_t>() > 1) {
                            throw ModelDeserializationError("Serializer: previous sign out of range");
                        }
                        std::int64_t s = cell.get<std::int64_t>();
                        if (s < -1 || s > 1) {
                            throw ModelDeserializationError("Serializer: previous sign out of range");
                        }
                        narrowed[i].push_back(static_cast<optim::Sign>(s));
                    }
                }
                auto signs = Matrix<optim::Sign>::from_rows(narrowed);
                auto tf = layers::transfer_from_name(entry.at("transfer_function").get<std::string>());

                chain.emplace_back(std::move(weights), std::move(rates), std::move(signs), tf);
            }

            return Network<T>(inputs_amount, std::move(chain));
        } catch (const ModelDeserializationError&) {
            throw;
        } catch (const nlohmann::json::exception& e) {
            throw ModelDeserializationError(std::string("Serializer: schema mismatch: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ModelDeserializationError(std::string("Serializer: inconsistent shapes: ") + e.what());
        }
    }

    template <typename T>
    static void save(const Network<T>& network, const std::string& filepath) {
        std::vector<std::uint8_t> bytes = to_cbor(network);

        std::ofstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            throw ModelIOError("Serializer: failed to open " + filepath + " for writing");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.close();
        if (!file) {
            throw ModelIOError("Serializer: error occurred while writing to " + filepath);
        }

        std::cout << "Serializer: Saved model to " << filepath << " (" << bytes.size() << " bytes)" << std::endl;
    }

    template <typename T>
    static Network<T> load(const std::string& filepath) {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            throw ModelIOError("Serializer: failed to open " + filepath);
        }

        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw ModelIOError("Serializer: read error on " + filepath);
        }

        return from_cbor<T>(bytes);
    }
};

} // namespace io

template <typename T>
void Network<T>::save(const std::string& filepath) const {
    io::Serializer::save(*this, filepath);
}

template <typename T>
Network<T> Network<T>::load(const std::string& filepath) {
    return io::Serializer::load<T>(filepath);
}

} // namespace rpropnet

#endif // RPROPNET_IO_SERIALIZER_HPP
