// src/generation/greedy_sampler.cpp
// Always picks the most probable token
#include "alm/generation/greedy_sampler.hpp"
#include <stdexcept>

namespace alm {

IndexTensor GreedySampler::sample(const Tensor& logits) {
    if (logits.ndim() == 0 || logits.last_dim() == 0) {
        throw std::invalid_argument("GreedySampler expects candidates on the last dimension");
    }

    Shape output_shape = logits.shape();
    output_shape.back() = 1;
    IndexTensor next_token(output_shape);

    // maxCoeff reports the first maximum, so ties go to the lowest index
    auto rows = logits.rows();
    for (Eigen::Index r = 0; r < rows.rows(); ++r) {
        Eigen::Index best_idx = 0;
        rows.row(r).maxCoeff(&best_idx);
        next_token.data()(r) = static_cast<int64_t>(best_idx);
    }

    return next_token;
}

} // namespace alm
