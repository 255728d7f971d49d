// include/alm/generation/greedy_sampler.hpp
#pragma once

#include "sampler.hpp"

namespace alm {

class GreedySampler : public Sampler {
public:
    GreedySampler() = default;
    ~GreedySampler() override = default;

    IndexTensor sample(const Tensor& logits) override;
};

} // namespace alm
