#ifndef MININN_NETWORK_SERIALIZATION_HPP
#define MININN_NETWORK_SERIALIZATION_HPP
#pragma once

#include "MultiLayerNetwork.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <type_traits>

namespace MiniNN {

    // "MNN1" in little-endian byte order.
    static constexpr std::uint32_t network_file_magic = 0x314E4E4D;
    static constexpr size_t max_layer_width = 1000000;

    namespace detail {

        template<typename V>
        void writeValue(std::ofstream& outFile, const V& value) {
            outFile.write(reinterpret_cast<const char*>(&value), sizeof(V));
        }

        template<typename V>
        V readValue(std::ifstream& inFile, const std::filesystem::path& filename, const std::string& what) {
            V value{};
            inFile.read(reinterpret_cast<char*>(&value), sizeof(V));
            if (!inFile) {
                std::cerr << "Truncated network file " << filename << " while reading " << what << std::endl;
                throw io_error("truncated network file " + filename.string() + " while reading " + what);
            }
            return value;
        }

        template<typename Derived>
        void writeMatrix(std::ofstream& outFile, const Eigen::PlainObjectBase<Derived>& mat) {
            Eigen::Index rows = mat.rows();
            Eigen::Index cols = mat.cols();
            writeValue(outFile, rows);
            writeValue(outFile, cols);
            outFile.write(reinterpret_cast<const char*>(mat.data()), sizeof(typename Derived::Scalar) * rows * cols);
        }

        template<typename Derived>
        void readMatrix(std::ifstream& inFile, const std::filesystem::path& filename, Eigen::PlainObjectBase<Derived>& mat, const std::string& what) {
            const auto rows = readValue<Eigen::Index>(inFile, filename, what + " rows");
            const auto cols = readValue<Eigen::Index>(inFile, filename, what + " cols");
            if (rows != mat.rows() || cols != mat.cols()) {
                std::cerr << "Invalid " << what << " dimensions: " << rows << "x" << cols << std::endl;
                throw io_error("invalid " + what + " dimensions " + shapeString(rows, cols) + ", expected "
                    + shapeString(mat.rows(), mat.cols()));
            }
            inFile.read(reinterpret_cast<char*>(mat.data()), sizeof(typename Derived::Scalar) * rows * cols);
            if (!inFile) {
                throw io_error("truncated network file " + filename.string() + " while reading " + what);
            }
        }

    };

    /**
     * Writes the network architecture and every weight and bias to `filename`.
     */
    template<typename T, bool _Release>
    void saveNetwork(const MultiLayerNetwork<T, _Release>& network, const std::filesystem::path& filename) {
        std::ofstream outFile(filename, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            std::cerr << "Error opening file for writing: " << filename << std::endl;
            throw io_error("cannot open " + filename.string() + " for writing");
        }

        detail::writeValue(outFile, network_file_magic);
        detail::writeValue(outFile, static_cast<std::uint32_t>(sizeof(T)));
        detail::writeValue(outFile, network.inputDim());
        detail::writeValue(outFile, network.layerCount());

        outFile.write(reinterpret_cast<const char*>(network.neurons().data()), sizeof(size_t) * network.layerCount());

        for (const auto activation : network.activations()) {
            auto activation_enum_value = static_cast<std::underlying_type_t<ActivationFunctionType>>(activation);
            detail::writeValue(outFile, activation_enum_value);
        }

        for (size_t i = 0; i < network.layerCount(); ++i) {
            detail::writeMatrix(outFile, network.linearLayer(i).weights());
            detail::writeMatrix(outFile, network.linearLayer(i).biases());
        }

        outFile.close();
        if (!outFile) {
            throw io_error("failed writing network to " + filename.string());
        }
    }

    template<typename T, bool _Release = true>
    MultiLayerNetwork<T, _Release> loadNetwork(const std::filesystem::path& filename) {
        std::ifstream inFile(filename, std::ios::binary);
        if (!inFile) {
            std::cerr << "Error opening file for reading: " << filename << std::endl;
            throw io_error("cannot open " + filename.string() + " for reading");
        }

        if (detail::readValue<std::uint32_t>(inFile, filename, "magic") != network_file_magic) {
            throw io_error(filename.string() + " is not a network file");
        }
        const auto scalar_size = detail::readValue<std::uint32_t>(inFile, filename, "scalar size");
        if (scalar_size != sizeof(T)) {
            throw io_error(filename.string() + " stores " + std::to_string(scalar_size) + "-byte scalars, expected "
                + std::to_string(sizeof(T)));
        }

        const auto input_dim = detail::readValue<size_t>(inFile, filename, "input dimension");
        const auto total_layers = detail::readValue<size_t>(inFile, filename, "layer count");
        if (input_dim == 0 || input_dim > max_layer_width || total_layers == 0 || total_layers > max_layer_width) {
            std::cerr << "Invalid or corrupted network header in " << filename << std::endl;
            throw io_error("invalid network header in " + filename.string());
        }

        std::vector<size_t> neurons(total_layers);
        for (size_t i = 0; i < total_layers; ++i) {
            neurons[i] = detail::readValue<size_t>(inFile, filename, "layer size");
            if (neurons[i] == 0 || neurons[i] > max_layer_width) {
                std::cerr << "Invalid layer size for layer " << i << ": " << neurons[i] << std::endl;
                throw io_error("invalid layer size " + std::to_string(neurons[i]) + " for layer " + std::to_string(i));
            }
        }

        std::vector<ActivationFunctionType> activations(total_layers);
        for (size_t i = 0; i < total_layers; ++i) {
            auto activation_enum_value = detail::readValue<std::underlying_type_t<ActivationFunctionType>>(inFile, filename, "activation");
            if (activation_enum_value < 0 || activation_enum_value > static_cast<int>(ActivationFunctionType::Tanh)) {
                throw io_error("invalid activation code " + std::to_string(activation_enum_value) + " for layer " + std::to_string(i));
            }
            activations[i] = static_cast<ActivationFunctionType>(activation_enum_value);
        }

        // The parameters must account for every remaining byte before anything is allocated.
        const auto payload_start = static_cast<std::uintmax_t>(inFile.tellg());
        std::error_code size_error;
        const auto file_size = std::filesystem::file_size(filename, size_error);
        if (size_error) {
            throw io_error("cannot stat " + filename.string() + ": " + size_error.message());
        }
        const std::uintmax_t remaining = file_size > payload_start ? file_size - payload_start : 0;
        std::uintmax_t expected = 0;
        size_t fan_in = input_dim;
        for (size_t i = 0; i < total_layers && expected <= remaining; ++i) {
            const auto header_bytes = static_cast<std::uintmax_t>(4 * sizeof(Eigen::Index));
            const auto value_count = static_cast<std::uintmax_t>(fan_in + 1) * neurons[i];
            expected += header_bytes + value_count * sizeof(T);
            fan_in = neurons[i];
        }
        if (expected != remaining) {
            std::cerr << "Network file " << filename << " holds " << remaining << " parameter bytes, header implies "
                << expected << std::endl;
            throw io_error("parameter payload of " + filename.string() + " does not match its header");
        }

        MultiLayerNetwork<T, _Release> network(input_dim, neurons, activations);
        for (size_t i = 0; i < total_layers; ++i) {
            detail::readMatrix(inFile, filename, network.linearLayer(i).weights(), "weights (layer " + std::to_string(i) + ")");
            detail::readMatrix(inFile, filename, network.linearLayer(i).biases(), "biases (layer " + std::to_string(i) + ")");
        }

        return network;
    }

};

#endif
