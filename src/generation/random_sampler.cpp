// src/generation/random_sampler.cpp
// Samples from the full softmax distribution
#include "alm/generation/random_sampler.hpp"
#include <stdexcept>

namespace alm {

RandomSampler::RandomSampler(float temperature, uint64_t seed)
    : temperature_(temperature), rng_(seed) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
}

IndexTensor RandomSampler::sample(const Tensor& logits) {
    Tensor probs = softmax(logits, temperature_);
    return multinomial(probs, 1, false, rng_);
}

void RandomSampler::set_temperature(float temperature) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
    temperature_ = temperature;
}

} // namespace alm
