// src/training/losses.cpp
#include "alm/training/losses.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace alm {

namespace {

void check_cross_entropy_shapes(const Shape& logits_shape, const Shape& targets_shape, const Shape& mask_shape) {
    if (logits_shape.empty()) {
        throw std::invalid_argument("Logits must have a class dimension");
    }
    Shape prefix(logits_shape.begin(), logits_shape.end() - 1);
    if (prefix != targets_shape) {
        throw std::invalid_argument("Logits shape " + shape_to_string(logits_shape) +
                                    " does not match targets shape " + shape_to_string(targets_shape));
    }
    if (mask_shape != targets_shape) {
        throw std::invalid_argument("Mask shape " + shape_to_string(mask_shape) +
                                    " does not match targets shape " + shape_to_string(targets_shape));
    }
}

} // anonymous namespace

template <typename Real, typename Logit>
BasicTensor<Real> cross_entropy(const BasicTensor<Logit>& logits,
                                const IndexTensor& targets,
                                const MaskTensor& mask,
                                std::optional<double> logits_soft_clip,
                                size_t num_chunks) {
    using Work = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using Column = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

    check_cross_entropy_shapes(logits.shape(), targets.shape(), mask.shape());
    if (num_chunks == 0) {
        throw std::invalid_argument("num_chunks must be positive");
    }
    if (logits_soft_clip && !(std::isfinite(*logits_soft_clip) && *logits_soft_clip > 0.0)) {
        throw std::invalid_argument("logits_soft_clip must be positive and finite");
    }

    const size_t n = targets.size();
    const size_t cardinality = logits.last_dim();
    typename BasicTensor<Real>::Storage ce = BasicTensor<Real>::Storage::Zero(n);
    if (n == 0) {
        return BasicTensor<Real>(ce, targets.shape());
    }
    if (cardinality == 0) {
        throw std::invalid_argument("Logits must have at least one class");
    }

    // Targets under a false mask are garbage; gather class 0 there instead
    // and drop the result below.
    std::vector<Eigen::Index> safe_targets(n, 0);
    for (size_t i = 0; i < n; ++i) {
        if (!mask.data()(i)) continue;
        const int64_t target = targets.data()(i);
        if (target < 0 || target >= static_cast<int64_t>(cardinality)) {
            throw std::out_of_range("Target index " + std::to_string(target) +
                                    " out of range for " + std::to_string(cardinality) + " classes");
        }
        safe_targets[i] = static_cast<Eigen::Index>(target);
    }

    auto all_rows = logits.rows();
    // ceil(n / num_chunks) without overflowing for huge num_chunks
    const size_t chunk_rows = n / num_chunks + (n % num_chunks != 0 ? 1 : 0);

    for (size_t start = 0; start < n; start += chunk_rows) {
        const size_t length = std::min(chunk_rows, n - start);

        Work chunk = all_rows.middleRows(start, length).template cast<Real>();
        if (logits_soft_clip) {
            const Real clip = static_cast<Real>(*logits_soft_clip);
            chunk = ((chunk.array() / clip).tanh() * clip).matrix();
        }

        // log-sum-exp; a non-finite row max is not subtracted so that rows of
        // -inf give a log partition of -inf instead of NaN
        Column shift = chunk.rowwise().maxCoeff();
        shift = shift.unaryExpr([](Real v) { return std::isfinite(v) ? v : Real(0); });
        Column log_partition =
            (shift.array() + (chunk.colwise() - shift).array().exp().rowwise().sum().log()).matrix();

        for (size_t r = 0; r < length; ++r) {
            const Real target_logit = chunk(r, safe_targets[start + r]);
            // A target of probability zero costs +inf, also when the whole row is -inf
            ce(start + r) = (std::isinf(target_logit) && target_logit < Real(0))
                                ? std::numeric_limits<Real>::infinity()
                                : log_partition(r) - target_logit;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (!mask.data()(i)) {
            ce(i) = Real(0);
        }
    }

    return BasicTensor<Real>(ce, targets.shape());
}

template <typename Real>
CodebookLoss reduce_codebook_loss(const BasicTensor<Real>& ce, const MaskTensor& mask) {
    if (ce.ndim() != 3) {
        throw std::invalid_argument("Cross entropy must be a 3D tensor [B, K, T], got " +
                                    shape_to_string(ce.shape()));
    }
    if (mask.shape() != ce.shape()) {
        throw std::invalid_argument("Mask shape " + shape_to_string(mask.shape()) +
                                    " does not match cross entropy shape " + shape_to_string(ce.shape()));
    }

    const size_t batch = ce.dim(0);
    const size_t codebooks = ce.dim(1);
    const size_t steps = ce.dim(2);

    CodebookLoss loss;
    loss.per_codebook.assign(codebooks, 0.0);

    for (size_t k = 0; k < codebooks; ++k) {
        double sum = 0.0;
        size_t count = 0;
        for (size_t b = 0; b < batch; ++b) {
            for (size_t t = 0; t < steps; ++t) {
                if (mask(b, k, t)) {
                    sum += static_cast<double>(ce(b, k, t));
                    ++count;
                }
            }
        }
        loss.per_codebook[k] = count > 0 ? sum / static_cast<double>(count) : 0.0;
        loss.total += loss.per_codebook[k];
    }

    if (codebooks > 0) {
        loss.total /= static_cast<double>(codebooks);
    }
    return loss;
}

CodebookLoss compute_codebook_loss(const Tensor& logits,
                                   const IndexTensor& targets,
                                   const MaskTensor& mask,
                                   const LossConfig& config) {
    config.validate();
    switch (config.dtype) {
        case DType::Float64:
            return reduce_codebook_loss(
                cross_entropy<double>(logits, targets, mask, config.logits_soft_clip, config.num_chunks), mask);
        case DType::Float32:
            break;
    }
    return reduce_codebook_loss(
        cross_entropy<float>(logits, targets, mask, config.logits_soft_clip, config.num_chunks), mask);
}

template BasicTensor<float> cross_entropy<float, float>(
    const BasicTensor<float>&, const IndexTensor&, const MaskTensor&, std::optional<double>, size_t);
template BasicTensor<double> cross_entropy<double, float>(
    const BasicTensor<float>&, const IndexTensor&, const MaskTensor&, std::optional<double>, size_t);
template BasicTensor<float> cross_entropy<float, double>(
    const BasicTensor<double>&, const IndexTensor&, const MaskTensor&, std::optional<double>, size_t);
template BasicTensor<double> cross_entropy<double, double>(
    const BasicTensor<double>&, const IndexTensor&, const MaskTensor&, std::optional<double>, size_t);

template CodebookLoss reduce_codebook_loss<float>(const BasicTensor<float>&, const MaskTensor&);
template CodebookLoss reduce_codebook_loss<double>(const BasicTensor<double>&, const MaskTensor&);

} // namespace alm
