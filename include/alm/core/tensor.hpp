#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <sstream>
#include <cstdint>
#include <stdexcept>
#include <initializer_list>
#include <cereal/types/vector.hpp>
#include <cereal/archives/binary.hpp>

#include "eigen_serialization.hpp"

namespace alm {

using Shape = std::vector<size_t>;

inline size_t shape_numel(const Shape& shape) {
    size_t total = 1;
    for (auto dim : shape) total *= dim;
    return total;
}

inline std::string shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

// Dense row-major tensor over a flat Eigen vector. The last dimension is the
// fastest varying one, so rows() views the tensor as [size / last, last].
template <typename Scalar>
class BasicTensor {
public:
    using Storage = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;
    using RowMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    BasicTensor() : data_(), shape_({0}), requires_grad_(false) {}

    explicit BasicTensor(const Shape& shape, bool requires_grad = false)
        : data_(Storage::Zero(shape_numel(shape))), shape_(shape), requires_grad_(requires_grad) {
        if (requires_grad) {
            grad_ = Storage::Zero(data_.size());
        }
    }

    BasicTensor(const Storage& data, const Shape& shape, bool requires_grad = false)
        : data_(data), shape_(shape), requires_grad_(requires_grad) {
        if (static_cast<size_t>(data.size()) != shape_numel(shape)) {
            throw std::invalid_argument("Tensor data of size " + std::to_string(data.size()) +
                                        " does not fit shape " + shape_to_string(shape));
        }
        if (requires_grad) {
            grad_ = Storage::Zero(data_.size());
        }
    }

    static BasicTensor zeros(const Shape& shape, bool requires_grad = false) {
        return BasicTensor(shape, requires_grad);
    }

    static BasicTensor full(const Shape& shape, Scalar value) {
        BasicTensor result(shape);
        result.data_.setConstant(value);
        return result;
    }

    static BasicTensor from_vector(const std::vector<Scalar>& values, const Shape& shape) {
        if (values.size() != shape_numel(shape)) {
            throw std::invalid_argument("from_vector: " + std::to_string(values.size()) +
                                        " values do not fit shape " + shape_to_string(shape));
        }
        BasicTensor result(shape);
        for (size_t i = 0; i < values.size(); ++i) {
            result.data_(i) = values[i];
        }
        return result;
    }

    // Accessors
    const Shape& shape() const { return shape_; }
    Storage& data() { return data_; }
    const Storage& data() const { return data_; }
    Storage& grad() { return grad_; }
    const Storage& grad() const { return grad_; }
    bool requires_grad() const { return requires_grad_; }
    bool has_grad() const { return requires_grad_ && grad_.size() == data_.size(); }

    void requires_grad(bool requires_grad) {
        requires_grad_ = requires_grad;
        if (requires_grad && grad_.size() != data_.size()) {
            grad_ = Storage::Zero(data_.size());
        }
    }

    void zero_grad() {
        if (grad_.size() > 0) {
            grad_.setZero();
        }
    }

    // Copy of the values without any gradient buffer
    BasicTensor detach() const {
        return BasicTensor(data_, shape_, false);
    }

    // Shape utilities
    size_t size() const { return static_cast<size_t>(data_.size()); }
    size_t ndim() const { return shape_.size(); }
    size_t dim(size_t axis) const {
        return (axis < shape_.size()) ? shape_[axis] : 1;
    }

    // Element access
    Scalar& operator()(size_t i) { return data_(check_flat(i)); }
    Scalar operator()(size_t i) const { return data_(check_flat(i)); }
    Scalar& operator()(size_t i, size_t j) { return data_(offset({i, j})); }
    Scalar operator()(size_t i, size_t j) const { return data_(offset({i, j})); }
    Scalar& operator()(size_t i, size_t j, size_t k) { return data_(offset({i, j, k})); }
    Scalar operator()(size_t i, size_t j, size_t k) const { return data_(offset({i, j, k})); }
    Scalar& operator()(size_t i, size_t j, size_t k, size_t l) { return data_(offset({i, j, k, l})); }
    Scalar operator()(size_t i, size_t j, size_t k, size_t l) const { return data_(offset({i, j, k, l})); }

    BasicTensor reshape(const Shape& new_shape) const {
        if (shape_numel(new_shape) != size()) {
            throw std::invalid_argument("Cannot reshape " + shape_to_string(shape_) +
                                        " into " + shape_to_string(new_shape));
        }
        BasicTensor result(data_, new_shape, requires_grad_);
        if (has_grad()) {
            result.grad_ = grad_;
        }
        return result;
    }

    // View as [size / last_dim, last_dim]
    Eigen::Map<const RowMatrix> rows() const {
        return Eigen::Map<const RowMatrix>(data_.data(), num_rows(), last_dim());
    }

    Eigen::Map<RowMatrix> rows() {
        return Eigen::Map<RowMatrix>(data_.data(), num_rows(), last_dim());
    }

    size_t last_dim() const {
        return shape_.empty() ? 1 : shape_.back();
    }

    size_t num_rows() const {
        size_t last = last_dim();
        return last == 0 ? 0 : size() / last;
    }

    template <typename T>
    BasicTensor<T> cast() const {
        return BasicTensor<T>(data_.template cast<T>(), shape_);
    }

    template <class Archive>
    void save(Archive& archive) const {
        archive(cereal::make_nvp("shape", shape_), cereal::make_nvp("data", data_));
    }

    template <class Archive>
    void load(Archive& archive) {
        Shape shape;
        Storage data;
        archive(cereal::make_nvp("shape", shape), cereal::make_nvp("data", data));
        if (static_cast<size_t>(data.size()) != shape_numel(shape)) {
            throw std::runtime_error("Corrupt tensor archive: payload does not match shape " +
                                     shape_to_string(shape));
        }
        shape_ = std::move(shape);
        data_ = std::move(data);
        requires_grad_ = false;
        grad_.resize(0);
    }

private:
    size_t check_flat(size_t i) const {
        if (i >= size()) {
            throw std::out_of_range("Flat index " + std::to_string(i) +
                                    " out of range for tensor of size " + std::to_string(size()));
        }
        return i;
    }

    size_t offset(std::initializer_list<size_t> index) const {
        if (index.size() != shape_.size()) {
            throw std::runtime_error(std::to_string(index.size()) + "D access requires " +
                                     std::to_string(index.size()) + "D tensor, got " +
                                     shape_to_string(shape_));
        }
        size_t flat = 0;
        size_t axis = 0;
        for (size_t i : index) {
            if (i >= shape_[axis]) {
                throw std::out_of_range("Index " + std::to_string(i) + " out of range for axis " +
                                        std::to_string(axis) + " of " + shape_to_string(shape_));
            }
            flat = flat * shape_[axis] + i;
            ++axis;
        }
        return flat;
    }

    Storage data_;
    Shape shape_;
    Storage grad_;
    bool requires_grad_;
};

using Tensor = BasicTensor<float>;
using DoubleTensor = BasicTensor<double>;
using IndexTensor = BasicTensor<int64_t>;
using MaskTensor = BasicTensor<bool>;

} // namespace alm
