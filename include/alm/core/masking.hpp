// include/alm/core/masking.hpp
#pragma once

#include <optional>
#include "tensor.hpp"

namespace alm {

// Padding mask from sequence lengths, e.g. [3, 5] -> [[1, 1, 1, 0, 0], [1, 1, 1, 1, 1]].
// The width is max_len when given (and non-zero), otherwise the longest
// length; it is never less than 1.
MaskTensor length_to_mask(const IndexTensor& lengths, std::optional<size_t> max_len = std::nullopt);

} // namespace alm
