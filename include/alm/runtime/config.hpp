// include/alm/runtime/config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace alm {

// Working precision of the loss computation
enum class DType {
    Float32,
    Float64
};

DType parse_dtype(const std::string& name);
std::string dtype_name(DType dtype);

struct LossConfig {
    DType dtype = DType::Float32;
    std::optional<double> logits_soft_clip;
    size_t num_chunks = 4;

    void validate() const;
};

struct SamplingConfig {
    bool use_sampling = true;
    float temperature = 1.0f;
    int top_k = 250;
    float top_p = 0.0f;
    uint64_t seed = 42;

    void validate() const;
};

struct DataConfig {
    size_t batch_size = 16;
    size_t num_workers = 0;
    std::optional<size_t> num_samples;
    uint64_t seed = 42;
    int64_t pad_id = 0;
    bool shuffle = false;

    void validate() const;
};

struct RunConfig {
    LossConfig loss;
    SamplingConfig sampling;
    DataConfig data;

    void validate() const;
};

void to_json(nlohmann::json& j, const LossConfig& config);
void from_json(const nlohmann::json& j, LossConfig& config);
void to_json(nlohmann::json& j, const SamplingConfig& config);
void from_json(const nlohmann::json& j, SamplingConfig& config);
void to_json(nlohmann::json& j, const DataConfig& config);
void from_json(const nlohmann::json& j, DataConfig& config);
void to_json(nlohmann::json& j, const RunConfig& config);
void from_json(const nlohmann::json& j, RunConfig& config);

// Fully resolved configuration as a plain JSON object
nlohmann::json dict_from_config(const RunConfig& config);

// Cartesian product of a JSON object of arrays, e.g.
// {"a": [1, 2], "b": ["x"]} -> [{"a": 1, "b": "x"}, {"a": 2, "b": "x"}].
// Scalars count as single-element arrays.
std::vector<nlohmann::json> product_dict(const nlohmann::json& grid);

} // namespace alm
