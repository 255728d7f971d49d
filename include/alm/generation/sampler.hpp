// include/alm/generation/sampler.hpp
#pragma once

#include <memory>
#include "../core/tensor.hpp"
#include "../runtime/config.hpp"

namespace alm {

// Picks the next token of every row of a [..., card] logits tensor.
// Returns [..., 1] class indices.
class Sampler {
public:
    virtual ~Sampler() = default;
    virtual IndexTensor sample(const Tensor& logits) = 0;
};

// Greedy when sampling is disabled, otherwise top-p if top_p > 0, then top-k
// if top_k > 0, then plain sampling from the full softmax.
std::unique_ptr<Sampler> make_sampler(const SamplingConfig& config);

} // namespace alm
