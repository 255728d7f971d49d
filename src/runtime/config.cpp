// src/runtime/config.cpp
#include "alm/runtime/config.hpp"
#include "alm/utils/hashing.hpp"
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace alm {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    // get<size_t>() would silently wrap a negative value
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        const nlohmann::json& value = j[key];
        if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
            throw std::runtime_error(std::string("Config value has wrong type: ") + key +
                                     " (expected a non-negative integer)");
        }
    }
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Config value has wrong type: ") + key + " (" + e.what() + ")");
    }
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key)) return;
    if (j[key].is_null()) {
        out.reset();
        return;
    }
    T value{};
    read_field(j, key, value);
    out = value;
}

} // anonymous namespace

DType parse_dtype(const std::string& name) {
    if (name == "float32" || name == "float") return DType::Float32;
    if (name == "float64" || name == "double") return DType::Float64;
    throw std::runtime_error("Unknown dtype: " + name);
}

std::string dtype_name(DType dtype) {
    return dtype == DType::Float64 ? "float64" : "float32";
}

void LossConfig::validate() const {
    if (num_chunks == 0) {
        throw std::runtime_error("Invalid config: loss.num_chunks must be positive");
    }
    if (logits_soft_clip && !(std::isfinite(*logits_soft_clip) && *logits_soft_clip > 0.0)) {
        throw std::runtime_error("Invalid config: loss.logits_soft_clip must be positive and finite");
    }
}

void SamplingConfig::validate() const {
    if (!(temperature > 0.0f)) {
        throw std::runtime_error("Invalid config: sampling.temperature must be positive");
    }
    if (top_k < 0) {
        throw std::runtime_error("Invalid config: sampling.top_k must be non-negative");
    }
    if (!(top_p >= 0.0f && top_p < 1.0f)) {
        throw std::runtime_error("Invalid config: sampling.top_p must be in [0, 1)");
    }
}

void DataConfig::validate() const {
    if (batch_size == 0) {
        throw std::runtime_error("Invalid config: data.batch_size must be positive");
    }
}

void RunConfig::validate() const {
    loss.validate();
    sampling.validate();
    data.validate();
}

void to_json(nlohmann::json& j, const LossConfig& config) {
    j = nlohmann::json{
        {"dtype", dtype_name(config.dtype)},
        {"logits_soft_clip", nullptr},
        {"num_chunks", config.num_chunks}
    };
    if (config.logits_soft_clip) {
        j["logits_soft_clip"] = *config.logits_soft_clip;
    }
}

void from_json(const nlohmann::json& j, LossConfig& config) {
    std::string dtype = dtype_name(config.dtype);
    read_field(j, "dtype", dtype);
    config.dtype = parse_dtype(dtype);
    read_optional(j, "logits_soft_clip", config.logits_soft_clip);
    read_field(j, "num_chunks", config.num_chunks);
}

void to_json(nlohmann::json& j, const SamplingConfig& config) {
    j = nlohmann::json{
        {"use_sampling", config.use_sampling},
        {"temperature", config.temperature},
        {"top_k", config.top_k},
        {"top_p", config.top_p},
        {"seed", config.seed}
    };
}

void from_json(const nlohmann::json& j, SamplingConfig& config) {
    read_field(j, "use_sampling", config.use_sampling);
    read_field(j, "temperature", config.temperature);
    read_field(j, "top_k", config.top_k);
    read_field(j, "top_p", config.top_p);
    if (j.contains("seed") && j["seed"].is_string()) {
        // Named seeds, e.g. an experiment or model name
        config.seed = get_seed_from_string(j["seed"].get<std::string>());
    } else {
        read_field(j, "seed", config.seed);
    }
}

void to_json(nlohmann::json& j, const DataConfig& config) {
    j = nlohmann::json{
        {"batch_size", config.batch_size},
        {"num_workers", config.num_workers},
        {"num_samples", nullptr},
        {"seed", config.seed},
        {"pad_id", config.pad_id},
        {"shuffle", config.shuffle}
    };
    if (config.num_samples) {
        j["num_samples"] = *config.num_samples;
    }
}

void from_json(const nlohmann::json& j, DataConfig& config) {
    read_field(j, "batch_size", config.batch_size);
    read_field(j, "num_workers", config.num_workers);
    read_optional(j, "num_samples", config.num_samples);
    read_field(j, "seed", config.seed);
    read_field(j, "pad_id", config.pad_id);
    read_field(j, "shuffle", config.shuffle);
}

void to_json(nlohmann::json& j, const RunConfig& config) {
    j = nlohmann::json{
        {"loss", config.loss},
        {"sampling", config.sampling},
        {"data", config.data}
    };
}

void from_json(const nlohmann::json& j, RunConfig& config) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid config: top level must be a JSON object");
    }
    if (j.contains("loss")) from_json(j["loss"], config.loss);
    if (j.contains("sampling")) from_json(j["sampling"], config.sampling);
    if (j.contains("data")) from_json(j["data"], config.data);
}

nlohmann::json dict_from_config(const RunConfig& config) {
    nlohmann::json j = config;
    return j;
}

std::vector<nlohmann::json> product_dict(const nlohmann::json& grid) {
    if (!grid.is_object()) {
        throw std::invalid_argument("product_dict expects a JSON object");
    }

    std::vector<nlohmann::json> combinations{nlohmann::json::object()};
    for (auto it = grid.begin(); it != grid.end(); ++it) {
        nlohmann::json values = it.value().is_array() ? it.value() : nlohmann::json::array({it.value()});

        std::vector<nlohmann::json> expanded;
        expanded.reserve(combinations.size() * values.size());
        for (const auto& partial : combinations) {
            for (const auto& value : values) {
                nlohmann::json next = partial;
                next[it.key()] = value;
                expanded.push_back(std::move(next));
            }
        }
        combinations = std::move(expanded);
    }
    return combinations;
}

} // namespace alm
