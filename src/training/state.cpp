// src/training/state.cpp
#include "alm/training/state.hpp"
#include "alm/utils/logging.hpp"
#include <fstream>
#include <stdexcept>
#include <cereal/archives/binary.hpp>

namespace alm {

Tensor& ParameterDict::register_parameter(const std::string& name, Tensor value) {
    auto [it, inserted] = parameters_.emplace(name, std::move(value));
    if (!inserted) {
        throw std::invalid_argument("Parameter already registered: " + name);
    }
    return it->second;
}

Tensor& ParameterDict::parameter(const std::string& name) {
    auto it = parameters_.find(name);
    if (it == parameters_.end()) {
        throw std::out_of_range("Unknown parameter: " + name);
    }
    return it->second;
}

const Tensor& ParameterDict::parameter(const std::string& name) const {
    auto it = parameters_.find(name);
    if (it == parameters_.end()) {
        throw std::out_of_range("Unknown parameter: " + name);
    }
    return it->second;
}

std::vector<Tensor*> ParameterDict::parameters() {
    std::vector<Tensor*> params;
    params.reserve(parameters_.size());
    for (auto& [name, tensor] : parameters_) {
        params.push_back(&tensor);
    }
    return params;
}

StateDict ParameterDict::state_dict() const {
    return copy_state(parameters_);
}

void ParameterDict::load_state_dict(const StateDict& state, bool strict) {
    if (strict) {
        for (const auto& [name, tensor] : parameters_) {
            if (state.count(name) == 0) {
                throw std::invalid_argument("Missing key in state dict: " + name);
            }
        }
    }

    for (const auto& [name, value] : state) {
        auto it = parameters_.find(name);
        if (it == parameters_.end()) {
            if (strict) {
                throw std::invalid_argument("Unexpected key in state dict: " + name);
            }
            continue;
        }
        if (it->second.shape() != value.shape()) {
            throw std::invalid_argument("Shape mismatch for " + name + ": expected " +
                                        shape_to_string(it->second.shape()) + ", got " +
                                        shape_to_string(value.shape()));
        }
    }

    // Validated above, so nothing below can leave the dict half-loaded
    for (const auto& [name, value] : state) {
        auto it = parameters_.find(name);
        if (it != parameters_.end()) {
            it->second.data() = value.data();
        }
    }
}

StateDict copy_state(const StateDict& state) {
    StateDict copy;
    for (const auto& [name, tensor] : state) {
        copy.emplace(name, tensor.detach());
    }
    return copy;
}

StateSwap::StateSwap(Stateful& module, const StateDict& state, bool strict)
    : module_(module), saved_(copy_state(module.state_dict())) {
    module_.load_state_dict(state, strict);
}

StateSwap::~StateSwap() {
    try {
        module_.load_state_dict(saved_);
    } catch (const std::exception& e) {
        logging::error(std::string("Failed to restore swapped state: ") + e.what());
    }
}

void save_state_dict(const StateDict& state, const std::string& path) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    cereal::BinaryOutputArchive archive(ofs);
    archive(state);
}

StateDict load_state_dict_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }

    StateDict state;
    try {
        cereal::BinaryInputArchive archive(ifs);
        archive(state);
    } catch (const cereal::Exception& e) {
        throw std::runtime_error("Failed to read state dict from " + path + ": " + e.what());
    }
    return state;
}

} // namespace alm
