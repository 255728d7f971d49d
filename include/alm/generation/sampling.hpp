// include/alm/generation/sampling.hpp
#pragma once

#include <random>
#include "../core/tensor.hpp"

namespace alm {

using Generator = std::mt19937_64;

// Row-wise softmax over the last dimension of logits / temperature
Tensor softmax(const Tensor& logits, float temperature = 1.0f);

// Draws num_samples class indices per row of `input`, whose last dimension
// holds the (not necessarily normalized) category weights. Any leading shape
// is accepted; the result has shape [..., num_samples].
// Throws std::invalid_argument for rows with negative or non-finite weights,
// rows summing to zero, or, without replacement, fewer positive weights than
// num_samples.
IndexTensor multinomial(const Tensor& input, size_t num_samples, bool replacement, Generator& generator);

// Sample one token among the k most probable classes of each row. The k
// probabilities are used as weights as-is. Equal probabilities are ordered by
// class index, lowest first. Result shape is [..., 1].
IndexTensor sample_top_k(const Tensor& probs, int k, Generator& generator);

// Nucleus sampling: sort each row descending and drop every class whose
// preceding cumulative probability already exceeds p. The most probable class
// always survives. p must be in [0, 1). Result shape is [..., 1].
IndexTensor sample_top_p(const Tensor& probs, float p, Generator& generator);

// The renormalized distribution sample_top_p draws from, in original class order
Tensor top_p_filter(const Tensor& probs, float p);

} // namespace alm
