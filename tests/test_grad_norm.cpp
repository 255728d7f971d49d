// tests/test_grad_norm.cpp
#undef NDEBUG
#include "alm/training/grad_norm.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace alm;

namespace {

Tensor with_grad(const std::vector<float>& grad) {
    Tensor param({grad.size()}, true);
    for (size_t i = 0; i < grad.size(); ++i) {
        param.grad()(i) = grad[i];
    }
    return param;
}

} // anonymous namespace

void test_category_norms() {
    std::cout << "=== Testing category norms ===" << std::endl;

    Tensor attn = with_grad({3.0f, 4.0f});        // norm 5
    Tensor mlp = with_grad({1.0f, 2.0f, 2.0f});   // norm 3
    Tensor frozen({4});                           // no gradient
    frozen.data().setConstant(100.0f);

    GradNormGetter::Categories categories = {
        {"attn", {&attn}},
        {"mlp", {&mlp, &frozen}},
        {"total", {&attn, &mlp}},
    };
    GradNormGetter getter(categories);
    assert(getter.num_categories() == 3);

    GradNorms result = getter();
    assert(std::abs(result.norms.at("attn") - 5.0f) < 1e-6f);
    assert(std::abs(result.norms.at("mlp") - 3.0f) < 1e-6f);
    assert(std::abs(result.norms.at("total") - std::sqrt(34.0f)) < 1e-5f);

    // Shared parameters are reported once, the frozen one not at all
    assert(result.grads.size() == 2);

    std::cout << "Category norms passed!" << std::endl;
}

void test_all_reduce() {
    std::cout << "=== Testing all-reduce hook ===" << std::endl;

    Tensor a = with_grad({3.0f, 4.0f});
    Tensor b = with_grad({0.0f, 6.0f});

    size_t calls = 0;
    GradNormGetter::Categories categories = {{"a", {&a}}, {"b", {&b}}};
    GradNormGetter getter(categories, [&calls](Eigen::VectorXf& norms2) {
        ++calls;
        // Squared norms in category name order
        assert(norms2.size() == 2);
        assert(std::abs(norms2(0) - 25.0f) < 1e-5f);
        assert(std::abs(norms2(1) - 36.0f) < 1e-5f);
        // Pretend a second rank holds identical gradients
        norms2 *= 2.0f;
    });

    GradNorms result = getter();
    assert(calls == 1);
    assert(std::abs(result.norms.at("a") - std::sqrt(50.0f)) < 1e-5f);
    assert(std::abs(result.norms.at("b") - std::sqrt(72.0f)) < 1e-5f);

    std::cout << "All-reduce hook passed!" << std::endl;
}

void test_gradients_change() {
    std::cout << "=== Testing repeated calls ===" << std::endl;

    Tensor a = with_grad({1.0f, 0.0f});
    GradNormGetter::Categories categories = {{"all", {&a}}};
    GradNormGetter getter(categories);
    assert(std::abs(getter().norms.at("all") - 1.0f) < 1e-6f);

    a.grad()(1) = 1.0f;
    assert(std::abs(getter().norms.at("all") - std::sqrt(2.0f)) < 1e-6f);

    a.zero_grad();
    assert(getter().norms.at("all") == 0.0f);

    std::cout << "Repeated calls passed!" << std::endl;
}

void test_invalid_categories() {
    std::cout << "=== Testing invalid categories ===" << std::endl;

    bool threw = false;
    try {
        GradNormGetter::Categories empty = {{"empty", {}}};
        GradNormGetter getter(empty);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        GradNormGetter::Categories null_param = {{"null", {nullptr}}};
        GradNormGetter getter(null_param);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Invalid categories passed!" << std::endl;
}

int main() {
    test_category_norms();
    test_all_reduce();
    test_gradients_change();
    test_invalid_categories();

    std::cout << "\n=== All grad norm tests completed successfully! ===" << std::endl;
    return 0;
}
