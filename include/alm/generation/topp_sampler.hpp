// include/alm/generation/topp_sampler.hpp
#pragma once

#include <cstdint>
#include "sampler.hpp"
#include "sampling.hpp"

namespace alm {

class TopPSampler : public Sampler {
public:
    TopPSampler(float p = 0.9f, float temperature = 1.0f, uint64_t seed = 42);
    ~TopPSampler() override = default;

    IndexTensor sample(const Tensor& logits) override;

    void seed(uint64_t seed) { rng_.seed(seed); }
    void set_p(float p);
    void set_temperature(float temperature);
    float get_p() const { return p_; }
    float get_temperature() const { return temperature_; }

private:
    float p_;
    float temperature_;
    Generator rng_;
};

} // namespace alm
