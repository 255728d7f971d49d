// include/alm/utils/hashing.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "../core/tensor.hpp"

namespace alm {

// Seed derived from the leading n_bytes of SHA-1(seed_str), big-endian.
// n_bytes must be in [1, 8].
uint64_t get_seed_from_string(const std::string& seed_str, size_t n_bytes = 8);

// Embedding-table index of a word: SHA-256 of its UTF-8 bytes, read as a
// big-endian integer, modulo vocab_size.
int hash_trick(const std::string& word, int vocab_size);

// Hex SHA-1 over the raw float32 values of every parameter, in order.
// Used to track regressions in model initialization across runs.
std::string model_hash(const std::vector<Tensor>& parameters);
std::string model_hash(const std::map<std::string, Tensor>& state);

} // namespace alm
