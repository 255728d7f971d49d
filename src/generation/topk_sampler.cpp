// src/generation/topk_sampler.cpp
// Limits the sampling to the top K most probable tokens
#include "alm/generation/topk_sampler.hpp"
#include <algorithm>
#include <stdexcept>

namespace alm {

TopKSampler::TopKSampler(int k, float temperature, uint64_t seed)
    : k_(k), temperature_(temperature), rng_(seed) {
    if (k <= 0) {
        throw std::invalid_argument("K must be positive");
    }
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
}

IndexTensor TopKSampler::sample(const Tensor& logits) {
    Tensor probs = softmax(logits, temperature_);
    // Ensure k doesn't exceed the number of classes
    const int k = static_cast<int>(std::min<size_t>(static_cast<size_t>(k_), probs.last_dim()));
    return sample_top_k(probs, k, rng_);
}

void TopKSampler::set_k(int k) {
    if (k <= 0) {
        throw std::invalid_argument("K must be positive");
    }
    k_ = k;
}

void TopKSampler::set_temperature(float temperature) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
    temperature_ = temperature;
}

} // namespace alm
