// include/alm/training/grad_norm.hpp
#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../core/tensor.hpp"

namespace alm {

struct GradNorms {
    std::map<std::string, float> norms;   // L2 norm of the gradients of each category
    std::vector<Tensor::Storage> grads;   // gradients that took part, in parameter order
};

// Gradient norm of several (possibly overlapping) groups of parameters.
//
// The squared norms are summed per category; when an all-reduce callback is
// given it receives the vector of squared norms (categories in name order)
// before the square root, e.g. to sum over data-parallel ranks.
class GradNormGetter {
public:
    using Categories = std::map<std::string, std::vector<const Tensor*>>;
    using AllReduce = std::function<void(Eigen::VectorXf&)>;

    explicit GradNormGetter(const Categories& categories, AllReduce all_reduce = AllReduce());

    GradNorms operator()() const;

    size_t num_categories() const { return category_index_.size(); }

private:
    struct Entry {
        const Tensor* tensor;
        std::vector<size_t> categories;
    };

    std::vector<Entry> entries_;
    std::map<std::string, size_t> category_index_;
    AllReduce all_reduce_;
};

} // namespace alm
