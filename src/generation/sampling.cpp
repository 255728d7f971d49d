// src/generation/sampling.cpp
#include "alm/generation/sampling.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace alm {

namespace {

void check_distribution_tensor(const Tensor& probs, const char* op) {
    if (probs.ndim() == 0 || probs.last_dim() == 0) {
        throw std::invalid_argument(std::string(op) + ": expected candidates on the last dimension, got shape " +
                                    shape_to_string(probs.shape()));
    }
}

void check_row(const float* row, size_t categories, size_t row_index, const char* op) {
    for (size_t c = 0; c < categories; ++c) {
        if (!std::isfinite(row[c]) || row[c] < 0.0f) {
            throw std::invalid_argument(std::string(op) + ": invalid distribution in row " +
                                        std::to_string(row_index) + ", weight " + std::to_string(row[c]) +
                                        " at class " + std::to_string(c));
        }
    }
}

// Class indices by decreasing probability; equal probabilities keep the lower
// index first, which makes the order a total one.
struct DescendingProbability {
    const float* row;

    bool operator()(size_t a, size_t b) const {
        if (row[a] != row[b]) return row[a] > row[b];
        return a < b;
    }
};

struct SortedDistribution {
    Tensor probs;          // [rows..., C], sorted descending, masked and renormalized
    IndexTensor indices;   // original class of every sorted slot
};

SortedDistribution nucleus(const Tensor& probs, float p) {
    check_distribution_tensor(probs, "sample_top_p");
    if (!(p >= 0.0f && p < 1.0f)) {
        throw std::invalid_argument("sample_top_p: p must be in [0, 1), got " + std::to_string(p));
    }

    const size_t categories = probs.last_dim();
    const size_t rows = probs.num_rows();

    SortedDistribution sorted{Tensor(probs.shape()), IndexTensor(probs.shape())};
    auto sorted_probs = sorted.probs.rows();
    auto sorted_indices = sorted.indices.rows();

    std::vector<size_t> order(categories);
    for (size_t r = 0; r < rows; ++r) {
        const float* row = probs.data().data() + r * categories;
        check_row(row, categories, r, "sample_top_p");

        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), DescendingProbability{row});

        // A class is dropped when the mass before it already exceeds p. The
        // first class has nothing before it and is always kept.
        float cumulative = 0.0f;
        float kept_mass = 0.0f;
        for (size_t j = 0; j < categories; ++j) {
            const float value = row[order[j]];
            cumulative += value;
            const bool dropped = (cumulative - value) > p;
            sorted_probs(r, j) = dropped ? 0.0f : value;
            sorted_indices(r, j) = static_cast<int64_t>(order[j]);
            kept_mass += sorted_probs(r, j);
        }

        if (!(kept_mass > 0.0f)) {
            throw std::invalid_argument("sample_top_p: row " + std::to_string(r) + " has no probability mass");
        }
        sorted_probs.row(r) /= kept_mass;
    }

    return sorted;
}

} // anonymous namespace

Tensor softmax(const Tensor& logits, float temperature) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
    check_distribution_tensor(logits, "softmax");

    Tensor result(logits.shape());
    auto in = logits.rows();
    auto out = result.rows();

    for (Eigen::Index r = 0; r < in.rows(); ++r) {
        Eigen::ArrayXf scaled = in.row(r).transpose().array() / temperature;
        Eigen::ArrayXf exp_values = (scaled - scaled.maxCoeff()).exp();
        out.row(r) = (exp_values / exp_values.sum()).matrix().transpose();
    }

    return result;
}

IndexTensor multinomial(const Tensor& input, size_t num_samples, bool replacement, Generator& generator) {
    check_distribution_tensor(input, "multinomial");
    if (num_samples == 0) {
        throw std::invalid_argument("multinomial: num_samples must be positive");
    }

    const size_t categories = input.last_dim();
    const size_t rows = input.num_rows();

    Shape output_shape = input.shape();
    output_shape.back() = num_samples;
    IndexTensor output(output_shape);
    auto out = output.rows();

    std::vector<double> weights(categories);
    for (size_t r = 0; r < rows; ++r) {
        const float* row = input.data().data() + r * categories;
        check_row(row, categories, r, "multinomial");

        double total = 0.0;
        size_t positive = 0;
        for (size_t c = 0; c < categories; ++c) {
            weights[c] = static_cast<double>(row[c]);
            total += weights[c];
            if (weights[c] > 0.0) ++positive;
        }
        if (!(total > 0.0)) {
            throw std::invalid_argument("multinomial: row " + std::to_string(r) + " sums to zero");
        }
        if (!replacement && num_samples > positive) {
            throw std::invalid_argument("multinomial: cannot draw " + std::to_string(num_samples) +
                                        " samples without replacement from " + std::to_string(positive) +
                                        " categories in row " + std::to_string(r));
        }

        if (replacement) {
            std::discrete_distribution<int64_t> dist(weights.begin(), weights.end());
            for (size_t s = 0; s < num_samples; ++s) {
                out(r, s) = dist(generator);
            }
        } else {
            for (size_t s = 0; s < num_samples; ++s) {
                std::discrete_distribution<int64_t> dist(weights.begin(), weights.end());
                const int64_t choice = dist(generator);
                out(r, s) = choice;
                weights[static_cast<size_t>(choice)] = 0.0;
            }
        }
    }

    return output;
}

IndexTensor sample_top_k(const Tensor& probs, int k, Generator& generator) {
    check_distribution_tensor(probs, "sample_top_k");
    const size_t categories = probs.last_dim();
    if (k < 1 || static_cast<size_t>(k) > categories) {
        throw std::invalid_argument("sample_top_k: k must be in [1, " + std::to_string(categories) +
                                    "], got " + std::to_string(k));
    }

    const size_t top = static_cast<size_t>(k);
    const size_t rows = probs.num_rows();

    Shape top_shape = probs.shape();
    top_shape.back() = top;
    Tensor top_probs(top_shape);
    IndexTensor top_indices(top_shape);
    auto top_probs_rows = top_probs.rows();
    auto top_indices_rows = top_indices.rows();

    std::vector<size_t> order(categories);
    for (size_t r = 0; r < rows; ++r) {
        const float* row = probs.data().data() + r * categories;
        check_row(row, categories, r, "sample_top_k");

        std::iota(order.begin(), order.end(), 0);
        std::partial_sort(order.begin(), order.begin() + top, order.end(), DescendingProbability{row});
        for (size_t j = 0; j < top; ++j) {
            top_probs_rows(r, j) = row[order[j]];
            top_indices_rows(r, j) = static_cast<int64_t>(order[j]);
        }
    }

    IndexTensor local = multinomial(top_probs, 1, false, generator);
    IndexTensor next_token(local.shape());
    for (size_t r = 0; r < rows; ++r) {
        next_token.data()(r) = top_indices_rows(r, local.data()(r));
    }
    return next_token;
}

IndexTensor sample_top_p(const Tensor& probs, float p, Generator& generator) {
    SortedDistribution sorted = nucleus(probs, p);

    IndexTensor local = multinomial(sorted.probs, 1, false, generator);
    IndexTensor next_token(local.shape());
    auto sorted_indices = sorted.indices.rows();
    for (size_t r = 0; r < sorted.probs.num_rows(); ++r) {
        next_token.data()(r) = sorted_indices(r, local.data()(r));
    }
    return next_token;
}

Tensor top_p_filter(const Tensor& probs, float p) {
    SortedDistribution sorted = nucleus(probs, p);

    Tensor filtered(probs.shape());
    auto out = filtered.rows();
    auto sorted_probs = sorted.probs.rows();
    auto sorted_indices = sorted.indices.rows();
    for (Eigen::Index r = 0; r < sorted_probs.rows(); ++r) {
        for (Eigen::Index j = 0; j < sorted_probs.cols(); ++j) {
            out(r, sorted_indices(r, j)) = sorted_probs(r, j);
        }
    }
    return filtered;
}

} // namespace alm
