// src/core/masking.cpp
#include "alm/core/masking.hpp"
#include <algorithm>
#include <stdexcept>

namespace alm {

MaskTensor length_to_mask(const IndexTensor& lengths, std::optional<size_t> max_len) {
    if (lengths.ndim() != 1) {
        throw std::invalid_argument("Length shape should be 1 dimensional, got " +
                                    shape_to_string(lengths.shape()));
    }

    size_t final_length = max_len.value_or(0);
    if (final_length == 0) {
        if (lengths.size() == 0) {
            throw std::invalid_argument("Cannot infer mask length from empty lengths");
        }
        final_length = static_cast<size_t>(std::max<int64_t>(lengths.data().maxCoeff(), 0));
    }
    // All-empty sequences still get a one-wide mask
    final_length = std::max<size_t>(final_length, 1);

    const size_t batch = lengths.size();
    MaskTensor mask({batch, final_length});
    for (size_t b = 0; b < batch; ++b) {
        const int64_t length = lengths(b);
        for (size_t t = 0; t < final_length; ++t) {
            mask(b, t) = static_cast<int64_t>(t) < length;
        }
    }
    return mask;
}

} // namespace alm
