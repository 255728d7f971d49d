// include/alm/generation/random_sampler.hpp
#pragma once

#include <cstdint>
#include "sampler.hpp"
#include "sampling.hpp"

namespace alm {

class RandomSampler : public Sampler {
public:
    explicit RandomSampler(float temperature = 1.0f, uint64_t seed = 42);
    ~RandomSampler() override = default;

    IndexTensor sample(const Tensor& logits) override;

    void seed(uint64_t seed) { rng_.seed(seed); }
    void set_temperature(float temperature);
    float get_temperature() const { return temperature_; }

private:
    float temperature_;
    Generator rng_;
};

} // namespace alm
