// src/training/grad_norm.cpp
#include "alm/training/grad_norm.hpp"
#include <stdexcept>
#include <unordered_map>

namespace alm {

GradNormGetter::GradNormGetter(const Categories& categories, AllReduce all_reduce)
    : all_reduce_(std::move(all_reduce)) {
    size_t index = 0;
    for (const auto& [name, tensors] : categories) {
        category_index_[name] = index++;
    }

    std::unordered_map<const Tensor*, size_t> entry_of;
    for (const auto& [name, tensors] : categories) {
        const size_t category = category_index_[name];
        for (const Tensor* tensor : tensors) {
            if (!tensor) {
                throw std::invalid_argument("Null parameter in category " + name);
            }
            auto it = entry_of.find(tensor);
            if (it == entry_of.end()) {
                entry_of.emplace(tensor, entries_.size());
                entries_.push_back({tensor, {category}});
            } else {
                entries_[it->second].categories.push_back(category);
            }
        }
    }

    if (entries_.empty()) {
        throw std::invalid_argument("GradNormGetter needs at least one parameter");
    }
}

GradNorms GradNormGetter::operator()() const {
    Eigen::VectorXf grad_norm2 = Eigen::VectorXf::Zero(static_cast<Eigen::Index>(category_index_.size()));
    GradNorms result;

    for (const auto& entry : entries_) {
        if (!entry.tensor->has_grad()) continue;

        const Tensor::Storage& grad = entry.tensor->grad();
        result.grads.push_back(grad);
        const float norm2 = grad.squaredNorm();
        for (size_t category : entry.categories) {
            grad_norm2(static_cast<Eigen::Index>(category)) += norm2;
        }
    }

    if (all_reduce_) {
        all_reduce_(grad_norm2);
    }

    Eigen::VectorXf grad_norm = grad_norm2.cwiseSqrt();
    for (const auto& [name, index] : category_index_) {
        result.norms[name] = grad_norm(static_cast<Eigen::Index>(index));
    }
    return result;
}

} // namespace alm
