// include/alm/generation/topk_sampler.hpp
#pragma once

#include <cstdint>
#include "sampler.hpp"
#include "sampling.hpp"

namespace alm {

class TopKSampler : public Sampler {
public:
    TopKSampler(int k = 250, float temperature = 1.0f, uint64_t seed = 42);
    ~TopKSampler() override = default;

    IndexTensor sample(const Tensor& logits) override;

    void seed(uint64_t seed) { rng_.seed(seed); }
    void set_k(int k);
    void set_temperature(float temperature);
    int get_k() const { return k_; }
    float get_temperature() const { return temperature_; }

private:
    int k_;
    float temperature_;
    Generator rng_;
};

} // namespace alm
