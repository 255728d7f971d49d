// src/training/data_loader.cpp
#include "alm/training/data_loader.hpp"
#include "alm/core/masking.hpp"
#include "alm/utils/logging.hpp"
#include <algorithm>
#include <fstream>
#include <future>
#include <numeric>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace alm {

namespace {

CodesSample parse_codes(const nlohmann::json& document) {
    const nlohmann::json& rows = document.is_object() ? document.at("codes") : document;
    if (!rows.is_array() || rows.empty() || !rows[0].is_array()) {
        throw std::runtime_error("Codes must be a non-empty array of codebook rows");
    }

    const size_t codebooks = rows.size();
    const size_t steps = rows[0].size();
    IndexTensor codes({codebooks, steps});
    for (size_t k = 0; k < codebooks; ++k) {
        if (!rows[k].is_array() || rows[k].size() != steps) {
            throw std::runtime_error("Codebook rows must all have " + std::to_string(steps) + " steps");
        }
        for (size_t t = 0; t < steps; ++t) {
            codes(k, t) = rows[k][t].get<int64_t>();
        }
    }
    return CodesSample{codes};
}

} // anonymous namespace

InMemoryCodesDataset::InMemoryCodesDataset(std::vector<CodesSample> samples) {
    for (auto& sample : samples) {
        add(std::move(sample));
    }
}

std::shared_ptr<InMemoryCodesDataset> InMemoryCodesDataset::from_jsonl(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open codes file: " + file_path);
    }

    auto dataset = std::make_shared<InMemoryCodesDataset>();
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            dataset->add(parse_codes(nlohmann::json::parse(line)));
        } catch (const std::exception& e) {
            throw std::runtime_error(file_path + ":" + std::to_string(line_number) + ": " + e.what());
        }
    }

    if (dataset->size() == 0) {
        throw std::runtime_error("No samples loaded from file: " + file_path);
    }

    logging::info("Loaded " + std::to_string(dataset->size()) + " samples from " + file_path);
    return dataset;
}

void InMemoryCodesDataset::add(CodesSample sample) {
    if (sample.codes.ndim() != 2) {
        throw std::invalid_argument("Codes must be [K, T], got " + shape_to_string(sample.codes.shape()));
    }
    samples_.push_back(std::move(sample));
}

CodesSample InMemoryCodesDataset::get(size_t index) const {
    if (index >= samples_.size()) {
        throw std::out_of_range("Sample index " + std::to_string(index) + " out of range");
    }
    return samples_[index];
}

Subset::Subset(std::shared_ptr<const CodesDataset> dataset, std::vector<size_t> indices)
    : dataset_(std::move(dataset)), indices_(std::move(indices)) {
    if (!dataset_) {
        throw std::invalid_argument("Subset needs a dataset");
    }
    for (size_t index : indices_) {
        if (index >= dataset_->size()) {
            throw std::out_of_range("Subset index " + std::to_string(index) + " out of range");
        }
    }
}

CodesSample Subset::get(size_t index) const {
    if (index >= indices_.size()) {
        throw std::out_of_range("Subset index " + std::to_string(index) + " out of range");
    }
    return dataset_->get(indices_[index]);
}

std::shared_ptr<const CodesDataset> random_subset(std::shared_ptr<const CodesDataset> dataset,
                                                  size_t max_samples, uint64_t seed) {
    if (!dataset) {
        throw std::invalid_argument("random_subset needs a dataset");
    }
    if (max_samples >= dataset->size()) {
        return dataset;
    }

    std::vector<size_t> permutation(dataset->size());
    std::iota(permutation.begin(), permutation.end(), 0);
    std::mt19937_64 generator(seed);
    std::shuffle(permutation.begin(), permutation.end(), generator);
    permutation.resize(max_samples);

    return std::make_shared<Subset>(std::move(dataset), std::move(permutation));
}

CodesBatch collate(const std::vector<CodesSample>& samples, const std::vector<size_t>& indices, int64_t pad_id) {
    if (samples.empty()) {
        throw std::invalid_argument("Cannot collate an empty batch");
    }

    const size_t batch = samples.size();
    const size_t codebooks = samples[0].codes.dim(0);
    IndexTensor lengths({batch});
    for (size_t b = 0; b < batch; ++b) {
        if (samples[b].codes.ndim() != 2 || samples[b].codes.dim(0) != codebooks) {
            throw std::invalid_argument("All samples in a batch must have " + std::to_string(codebooks) +
                                        " codebooks, got " + shape_to_string(samples[b].codes.shape()));
        }
        lengths(b) = static_cast<int64_t>(samples[b].codes.dim(1));
    }

    MaskTensor time_mask = length_to_mask(lengths);
    const size_t steps = time_mask.dim(1);

    CodesBatch result;
    result.codes = IndexTensor::full({batch, codebooks, steps}, pad_id);
    result.mask = MaskTensor({batch, codebooks, steps});
    result.lengths = lengths;
    result.indices = indices;

    for (size_t b = 0; b < batch; ++b) {
        const IndexTensor& codes = samples[b].codes;
        for (size_t k = 0; k < codebooks; ++k) {
            for (size_t t = 0; t < steps; ++t) {
                result.mask(b, k, t) = time_mask(b, t);
                if (t < codes.dim(1)) {
                    result.codes(b, k, t) = codes(k, t);
                }
            }
        }
    }
    return result;
}

DataLoader::DataLoader(std::shared_ptr<const CodesDataset> dataset, const LoaderOptions& options)
    : dataset_(std::move(dataset)), options_(options),
      executor_(runtime::get_pool_executor(options.num_workers)),
      current_index_(0), rng_(options.seed) {
    if (!dataset_) {
        throw std::invalid_argument("DataLoader needs a dataset");
    }
    if (options_.batch_size == 0) {
        throw std::invalid_argument("Batch size must be positive");
    }

    order_.resize(dataset_->size());
    std::iota(order_.begin(), order_.end(), 0);
    if (options_.shuffle) {
        shuffle_order();
    }
}

void DataLoader::shuffle_order() {
    std::shuffle(order_.begin(), order_.end(), rng_);
}

bool DataLoader::has_next() const {
    const size_t remaining = order_.size() - current_index_;
    if (options_.drop_last) {
        return remaining >= options_.batch_size;
    }
    return remaining > 0;
}

CodesBatch DataLoader::next_batch() {
    if (!has_next()) {
        throw std::out_of_range("No more batches available");
    }

    size_t end_index = std::min(current_index_ + options_.batch_size, order_.size());
    std::vector<size_t> indices(order_.begin() + current_index_, order_.begin() + end_index);

    // Fetch through the executor so that num_workers > 0 loads in parallel
    std::vector<std::future<CodesSample>> pending;
    pending.reserve(indices.size());
    for (size_t index : indices) {
        const CodesDataset* dataset = dataset_.get();
        pending.push_back(executor_->submit([dataset, index]() { return dataset->get(index); }));
    }

    std::vector<CodesSample> samples;
    samples.reserve(pending.size());
    for (auto& future : pending) {
        samples.push_back(future.get());
    }

    current_index_ = end_index;
    return collate(samples, indices, options_.pad_id);
}

void DataLoader::reset() {
    current_index_ = 0;

    // Reshuffle for the next epoch
    if (options_.shuffle) {
        shuffle_order();
    }
}

size_t DataLoader::num_batches() const {
    if (options_.drop_last) {
        return order_.size() / options_.batch_size;
    }
    return (order_.size() + options_.batch_size - 1) / options_.batch_size;
}

DataLoader get_loader(std::shared_ptr<const CodesDataset> dataset,
                      std::optional<size_t> num_samples,
                      size_t batch_size,
                      size_t num_workers,
                      uint64_t seed,
                      LoaderOptions options) {
    if (num_samples) {
        dataset = random_subset(std::move(dataset), *num_samples, seed);
    }
    options.batch_size = batch_size;
    options.num_workers = num_workers;
    options.seed = seed;
    return DataLoader(std::move(dataset), options);
}

std::shared_ptr<const CodesDataset> get_dataset_from_loader(const DataLoader& loader) {
    if (auto subset = std::dynamic_pointer_cast<const Subset>(loader.dataset())) {
        return subset->dataset();
    }
    return loader.dataset();
}

} // namespace alm
