// include/alm/training/data_loader.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "../core/tensor.hpp"
#include "../runtime/executor.hpp"

namespace alm {

// One item: discrete audio codes, [K, T] (codebooks x timesteps)
struct CodesSample {
    IndexTensor codes;
};

// A padded batch of samples
struct CodesBatch {
    IndexTensor codes;             // [B, K, T], padded with pad_id
    MaskTensor mask;               // [B, K, T], false on padding
    IndexTensor lengths;           // [B]
    std::vector<size_t> indices;   // dataset index of every row
};

class CodesDataset {
public:
    virtual ~CodesDataset() = default;
    virtual size_t size() const = 0;
    virtual CodesSample get(size_t index) const = 0;
};

class InMemoryCodesDataset : public CodesDataset {
public:
    InMemoryCodesDataset() = default;
    explicit InMemoryCodesDataset(std::vector<CodesSample> samples);

    // One JSON document per line: {"codes": [[...], ...]} or [[...], ...]
    static std::shared_ptr<InMemoryCodesDataset> from_jsonl(const std::string& file_path);

    void add(CodesSample sample);
    size_t size() const override { return samples_.size(); }
    CodesSample get(size_t index) const override;

private:
    std::vector<CodesSample> samples_;
};

class Subset : public CodesDataset {
public:
    Subset(std::shared_ptr<const CodesDataset> dataset, std::vector<size_t> indices);

    size_t size() const override { return indices_.size(); }
    CodesSample get(size_t index) const override;

    const std::shared_ptr<const CodesDataset>& dataset() const { return dataset_; }
    const std::vector<size_t>& indices() const { return indices_; }

private:
    std::shared_ptr<const CodesDataset> dataset_;
    std::vector<size_t> indices_;
};

// The dataset itself if it holds at most max_samples items, otherwise a
// Subset of max_samples items picked by a seeded permutation.
std::shared_ptr<const CodesDataset> random_subset(std::shared_ptr<const CodesDataset> dataset,
                                                  size_t max_samples, uint64_t seed = 42);

// Pads samples of equal K to the longest T
CodesBatch collate(const std::vector<CodesSample>& samples, const std::vector<size_t>& indices, int64_t pad_id);

struct LoaderOptions {
    size_t batch_size = 16;
    size_t num_workers = 0;
    bool shuffle = false;
    uint64_t seed = 42;
    int64_t pad_id = 0;
    bool drop_last = false;
};

class DataLoader {
public:
    DataLoader(std::shared_ptr<const CodesDataset> dataset, const LoaderOptions& options);

    bool has_next() const;
    CodesBatch next_batch();

    void reset();
    size_t num_batches() const;

    const std::shared_ptr<const CodesDataset>& dataset() const { return dataset_; }
    const LoaderOptions& options() const { return options_; }

private:
    std::shared_ptr<const CodesDataset> dataset_;
    LoaderOptions options_;
    std::unique_ptr<runtime::Executor> executor_;
    std::vector<size_t> order_;
    size_t current_index_;
    std::mt19937_64 rng_;

    void shuffle_order();
};

// Optionally restrict the dataset to a random subset of num_samples items,
// then wrap it in a DataLoader.
DataLoader get_loader(std::shared_ptr<const CodesDataset> dataset,
                      std::optional<size_t> num_samples,
                      size_t batch_size,
                      size_t num_workers,
                      uint64_t seed,
                      LoaderOptions options = LoaderOptions());

// The dataset behind a loader, looking through a Subset
std::shared_ptr<const CodesDataset> get_dataset_from_loader(const DataLoader& loader);

} // namespace alm
