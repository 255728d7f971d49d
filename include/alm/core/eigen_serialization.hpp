#pragma once

#include <Eigen/Dense>
#include <cereal/cereal.hpp>
#include <cstdint>

namespace cereal {

// Dynamic column vectors, the storage of alm::BasicTensor. Binary archives only.
template <class Archive, typename Scalar, int Options, int MaxRows>
void save(Archive& archive, const Eigen::Matrix<Scalar, Eigen::Dynamic, 1, Options, MaxRows, 1>& vector) {
    std::uint64_t size = static_cast<std::uint64_t>(vector.size());
    archive(size);
    archive(binary_data(vector.data(), static_cast<std::size_t>(size) * sizeof(Scalar)));
}

template <class Archive, typename Scalar, int Options, int MaxRows>
void load(Archive& archive, Eigen::Matrix<Scalar, Eigen::Dynamic, 1, Options, MaxRows, 1>& vector) {
    std::uint64_t size = 0;
    archive(size);
    vector.resize(static_cast<Eigen::Index>(size));
    archive(binary_data(vector.data(), static_cast<std::size_t>(size) * sizeof(Scalar)));
}

} // namespace cereal
