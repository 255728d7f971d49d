// src/generation/topp_sampler.cpp
// Limits the sampling to the smallest set of tokens whose cumulative
// probability reaches p
#include "alm/generation/topp_sampler.hpp"
#include <stdexcept>

namespace alm {

TopPSampler::TopPSampler(float p, float temperature, uint64_t seed)
    : p_(p), temperature_(temperature), rng_(seed) {
    if (!(p >= 0.0f && p < 1.0f)) {
        throw std::invalid_argument("P must be in range [0, 1)");
    }
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
}

IndexTensor TopPSampler::sample(const Tensor& logits) {
    Tensor probs = softmax(logits, temperature_);
    return sample_top_p(probs, p_, rng_);
}

void TopPSampler::set_p(float p) {
    if (!(p >= 0.0f && p < 1.0f)) {
        throw std::invalid_argument("P must be in range [0, 1)");
    }
    p_ = p;
}

void TopPSampler::set_temperature(float temperature) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
    temperature_ = temperature;
}

} // namespace alm
