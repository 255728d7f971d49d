// tests/test_sampling.cpp
#undef NDEBUG
#include "alm/generation/sampling.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <set>
#include <stdexcept>

using namespace alm;

namespace {

Tensor random_probs(const Shape& shape, uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<float> dist(0.0f, 2.0f);
    Tensor logits(shape);
    for (size_t i = 0; i < logits.size(); ++i) {
        logits(i) = dist(gen);
    }
    return softmax(logits);
}

// Classes of one row ordered by decreasing probability, lowest index first on ties
std::vector<size_t> ranked(const Tensor& probs, size_t row) {
    auto rows = probs.rows();
    std::vector<size_t> order(probs.last_dim());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return rows(row, a) > rows(row, b); });
    return order;
}

} // anonymous namespace

void test_softmax() {
    std::cout << "=== Testing softmax ===" << std::endl;

    Tensor logits = Tensor::from_vector({1.0f, 2.0f, 3.0f, 1000.0f, 1000.0f, 1000.0f}, {2, 3});
    Tensor probs = softmax(logits);
    auto rows = probs.rows();
    for (Eigen::Index r = 0; r < rows.rows(); ++r) {
        assert(std::abs(rows.row(r).sum() - 1.0f) < 1e-6f);
    }
    assert(probs(0, 2) > probs(0, 1) && probs(0, 1) > probs(0, 0));
    assert(std::abs(probs(1, 0) - 1.0f / 3.0f) < 1e-6f);

    // Higher temperature flattens the distribution
    Tensor flat = softmax(logits, 10.0f);
    assert(flat(0, 2) < probs(0, 2));

    bool threw = false;
    try {
        softmax(logits, 0.0f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Softmax passed!" << std::endl;
}

void test_multinomial_shapes() {
    std::cout << "=== Testing multinomial shapes ===" << std::endl;

    Generator gen(0);
    Tensor probs = random_probs({2, 3, 5}, 1);

    IndexTensor one = multinomial(probs, 1, false, gen);
    assert(one.shape() == Shape({2, 3, 1}));

    IndexTensor many = multinomial(probs, 4, true, gen);
    assert(many.shape() == Shape({2, 3, 4}));
    for (size_t i = 0; i < many.size(); ++i) {
        assert(many(i) >= 0 && many(i) < 5);
    }

    Tensor flat = Tensor::from_vector({0.2f, 0.3f, 0.5f}, {3});
    IndexTensor drawn = multinomial(flat, 2, true, gen);
    assert(drawn.shape() == Shape({2}));

    std::cout << "Multinomial shapes passed!" << std::endl;
}

void test_multinomial_support() {
    std::cout << "=== Testing multinomial support ===" << std::endl;

    Generator gen(1);
    // Unnormalized weights are fine; zero-weight classes are never drawn
    Tensor weights = Tensor::from_vector({0.0f, 3.0f, 0.0f, 1.0f}, {1, 4});
    for (int i = 0; i < 200; ++i) {
        IndexTensor drawn = multinomial(weights, 1, true, gen);
        assert(drawn(0, 0) == 1 || drawn(0, 0) == 3);
    }

    // Without replacement every positive class appears exactly once
    IndexTensor both = multinomial(weights, 2, false, gen);
    std::set<int64_t> seen = {both(0, 0), both(0, 1)};
    assert(seen == std::set<int64_t>({1, 3}));

    // Frequencies follow the weights
    Tensor skewed = Tensor::from_vector({0.1f, 0.9f}, {2});
    IndexTensor draws = multinomial(skewed, 5000, true, gen);
    size_t ones = 0;
    for (size_t i = 0; i < draws.size(); ++i) {
        ones += draws(i) == 1 ? 1 : 0;
    }
    assert(ones > 4300 && ones < 4700);

    std::cout << "Multinomial support passed!" << std::endl;
}

void test_multinomial_errors() {
    std::cout << "=== Testing multinomial errors ===" << std::endl;

    Generator gen(2);
    auto throws = [&](const Tensor& input, size_t num_samples, bool replacement) {
        try {
            multinomial(input, num_samples, replacement, gen);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    assert(throws(Tensor::from_vector({0.5f, -0.1f}, {2}), 1, true));
    assert(throws(Tensor::from_vector({0.5f, std::nanf("")}, {2}), 1, true));
    assert(throws(Tensor::from_vector({0.5f, INFINITY}, {2}), 1, true));
    assert(throws(Tensor::from_vector({0.0f, 0.0f}, {2}), 1, true));
    assert(throws(Tensor::from_vector({0.5f, 0.0f}, {2}), 2, false));
    assert(throws(Tensor::from_vector({0.5f, 0.5f}, {2}), 0, true));
    assert(!throws(Tensor::from_vector({0.5f, 0.0f}, {2}), 2, true));

    std::cout << "Multinomial errors passed!" << std::endl;
}

void test_top_k_support() {
    std::cout << "=== Testing top-k support ===" << std::endl;

    Generator gen(3);
    Tensor probs = random_probs({4, 10}, 4);
    const int k = 3;

    std::vector<std::set<int64_t>> allowed;
    for (size_t r = 0; r < 4; ++r) {
        std::vector<size_t> order = ranked(probs, r);
        allowed.emplace_back(order.begin(), order.begin() + k);
    }

    for (int i = 0; i < 300; ++i) {
        IndexTensor next = sample_top_k(probs, k, gen);
        assert(next.shape() == Shape({4, 1}));
        for (size_t r = 0; r < 4; ++r) {
            assert(allowed[r].count(next(r, 0)) == 1);
        }
    }

    // Sampling, not argmax: every one of the k classes shows up
    Tensor spread = Tensor::from_vector({0.15f, 0.3f, 0.25f, 0.3f}, {1, 4});
    std::set<int64_t> spread_hit;
    for (int i = 0; i < 300; ++i) {
        spread_hit.insert(sample_top_k(spread, 3, gen)(0, 0));
    }
    assert(spread_hit == std::set<int64_t>({1, 2, 3}));

    // k = 1 is greedy
    IndexTensor greedy = sample_top_k(probs, 1, gen);
    for (size_t r = 0; r < 4; ++r) {
        assert(greedy(r, 0) == static_cast<int64_t>(ranked(probs, r)[0]));
    }

    std::cout << "Top-k support passed!" << std::endl;
}

void test_top_k_ties() {
    std::cout << "=== Testing top-k ties ===" << std::endl;

    Generator gen(4);
    Tensor uniform = Tensor::full({1, 6}, 1.0f / 6.0f);
    for (int i = 0; i < 200; ++i) {
        IndexTensor next = sample_top_k(uniform, 2, gen);
        assert(next(0, 0) == 0 || next(0, 0) == 1);
    }

    Tensor tied = Tensor::from_vector({0.1f, 0.3f, 0.3f, 0.3f}, {4});
    for (int i = 0; i < 200; ++i) {
        IndexTensor next = sample_top_k(tied, 2, gen);
        assert(next.shape() == Shape({1}));
        assert(next(0) == 1 || next(0) == 2);
    }

    std::cout << "Top-k ties passed!" << std::endl;
}

void test_top_k_errors() {
    std::cout << "=== Testing top-k errors ===" << std::endl;

    Generator gen(5);
    Tensor probs = random_probs({2, 5}, 6);
    for (int k : {0, -1, 6}) {
        bool threw = false;
        try {
            sample_top_k(probs, k, gen);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    IndexTensor all = sample_top_k(probs, 5, gen);
    assert(all.shape() == Shape({2, 1}));

    std::cout << "Top-k errors passed!" << std::endl;
}

void test_top_p_filter() {
    std::cout << "=== Testing top-p filter ===" << std::endl;

    Tensor probs = Tensor::from_vector({0.2f, 0.5f, 0.3f}, {1, 3});

    // p = 0 keeps only the most probable class
    Tensor top1 = top_p_filter(probs, 0.0f);
    assert(top1(0, 1) == 1.0f);
    assert(top1(0, 0) == 0.0f && top1(0, 2) == 0.0f);

    // 0.3 comes after a mass of 0.5 <= 0.55 and is kept; 0.2 comes after
    // 0.8 > 0.55 and is dropped
    Tensor nucleus = top_p_filter(probs, 0.55f);
    assert(nucleus(0, 0) == 0.0f);
    assert(std::abs(nucleus(0, 1) - 0.625f) < 1e-6f);
    assert(std::abs(nucleus(0, 2) - 0.375f) < 1e-6f);

    // Nearly 1 keeps everything
    Tensor everything = top_p_filter(probs, 0.999f);
    assert(std::abs(everything(0, 0) - 0.2f) < 1e-6f);

    std::cout << "Top-p filter passed!" << std::endl;
}

void test_top_p_nested_supports() {
    std::cout << "=== Testing top-p nested supports ===" << std::endl;

    Tensor probs = random_probs({3, 12}, 7);
    const std::vector<float> ps = {0.0f, 0.1f, 0.3f, 0.5f, 0.7f, 0.9f, 0.99f};

    for (size_t r = 0; r < 3; ++r) {
        std::set<size_t> previous;
        for (float p : ps) {
            Tensor filtered = top_p_filter(probs, p);
            std::set<size_t> support;
            float total = 0.0f;
            for (size_t c = 0; c < 12; ++c) {
                if (filtered(r, c) > 0.0f) support.insert(c);
                total += filtered(r, c);
            }
            assert(std::abs(total - 1.0f) < 1e-5f);
            assert(support.count(ranked(probs, r)[0]) == 1);
            assert(std::includes(support.begin(), support.end(), previous.begin(), previous.end()));
            previous = support;
        }
    }

    std::cout << "Top-p nested supports passed!" << std::endl;
}

void test_top_p_sampling() {
    std::cout << "=== Testing top-p sampling ===" << std::endl;

    Generator gen(8);
    Tensor probs = Tensor::from_vector({0.2f, 0.5f, 0.3f, 0.1f, 0.1f, 0.8f}, {2, 1, 3});

    for (int i = 0; i < 200; ++i) {
        IndexTensor next = sample_top_p(probs, 0.0f, gen);
        assert(next.shape() == Shape({2, 1, 1}));
        assert(next(0, 0, 0) == 1);
        assert(next(1, 0, 0) == 2);
    }

    for (int i = 0; i < 200; ++i) {
        IndexTensor next = sample_top_p(probs, 0.55f, gen);
        assert(next(0, 0, 0) == 1 || next(0, 0, 0) == 2);
    }

    for (float p : {-0.1f, 1.0f, 1.5f}) {
        bool threw = false;
        try {
            sample_top_p(probs, p, gen);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "Top-p sampling passed!" << std::endl;
}

void test_determinism() {
    std::cout << "=== Testing determinism ===" << std::endl;

    Tensor probs = random_probs({3, 4, 16}, 9);

    Generator a(1234);
    Generator b(1234);
    for (int i = 0; i < 10; ++i) {
        assert(sample_top_k(probs, 5, a).data() == sample_top_k(probs, 5, b).data());
        assert(sample_top_p(probs, 0.8f, a).data() == sample_top_p(probs, 0.8f, b).data());
        assert(multinomial(probs, 3, false, a).data() == multinomial(probs, 3, false, b).data());
    }

    std::cout << "Determinism passed!" << std::endl;
}

int main() {
    test_softmax();
    test_multinomial_shapes();
    test_multinomial_support();
    test_multinomial_errors();
    test_top_k_support();
    test_top_k_ties();
    test_top_k_errors();
    test_top_p_filter();
    test_top_p_nested_supports();
    test_top_p_sampling();
    test_determinism();

    std::cout << "\n=== All sampling tests completed successfully! ===" << std::endl;
    return 0;
}
