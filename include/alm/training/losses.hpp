// include/alm/training/losses.hpp
#pragma once

#include <optional>
#include <vector>
#include "../core/tensor.hpp"
#include "../runtime/config.hpp"

namespace alm {

constexpr size_t kDefaultCrossEntropyChunks = 4;

// Cross entropy between multi-codebook targets and the model's logits.
//
//   logits  [B, K, T, card]  (any leading shape works, classes on the last axis)
//   targets [B, K, T]        class indices, arbitrary where mask is false
//   mask    [B, K, T]        true for valid timesteps
//
// Returns [B, K, T] in precision Real, with exactly 0 at masked positions.
// Rows are processed in num_chunks contiguous chunks so that only one chunk
// is held in the working precision at a time. With logits_soft_clip = c the
// logits go through c * tanh(x / c) first (30.0 is a reasonable value).
template <typename Real = float, typename Logit = float>
BasicTensor<Real> cross_entropy(const BasicTensor<Logit>& logits,
                                const IndexTensor& targets,
                                const MaskTensor& mask,
                                std::optional<double> logits_soft_clip = std::nullopt,
                                size_t num_chunks = kDefaultCrossEntropyChunks);

struct CodebookLoss {
    double total = 0.0;
    std::vector<double> per_codebook;
};

// Mean cross entropy over the valid timesteps of each codebook (axis 1 of
// [B, K, T]); total is the mean over codebooks.
template <typename Real>
CodebookLoss reduce_codebook_loss(const BasicTensor<Real>& ce, const MaskTensor& mask);

// cross_entropy + reduce_codebook_loss in the precision named by the config
CodebookLoss compute_codebook_loss(const Tensor& logits,
                                   const IndexTensor& targets,
                                   const MaskTensor& mask,
                                   const LossConfig& config);

} // namespace alm
