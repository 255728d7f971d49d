// src/sampling_demo.cpp
// Scores a batch of audio codes against random logits and samples next tokens.
//
//   alm_sampling_demo [config.json] [codes.jsonl]
#include "alm/generation/sampler.hpp"
#include "alm/runtime/init.hpp"
#include "alm/training/data_loader.hpp"
#include "alm/training/losses.hpp"
#include "alm/utils/logging.hpp"
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

using namespace alm;

namespace {

constexpr size_t kCardinality = 64;
constexpr size_t kCodebooks = 4;

std::shared_ptr<const CodesDataset> synthetic_dataset(uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::uniform_int_distribution<int64_t> code(0, kCardinality - 1);
    std::uniform_int_distribution<size_t> length(8, 32);

    std::vector<CodesSample> samples;
    for (size_t i = 0; i < 12; ++i) {
        IndexTensor codes({kCodebooks, length(gen)});
        for (size_t j = 0; j < codes.size(); ++j) {
            codes(j) = code(gen);
        }
        samples.push_back({codes});
    }
    return std::make_shared<InMemoryCodesDataset>(std::move(samples));
}

Tensor random_logits(const Shape& shape, uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<float> dist(0.0f, 2.0f);
    Tensor logits(shape);
    for (size_t i = 0; i < logits.size(); ++i) {
        logits(i) = dist(gen);
    }
    return logits;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto& state = runtime::SystemState::get_instance();
        if (argc > 1) {
            state.initialize(argv[1]);
        } else {
            state.initialize_from_json(nlohmann::json::object());
        }
        const RunConfig config = state.run_config();
        std::cout << "Configuration:\n" << dict_from_config(config).dump(2) << std::endl;

        std::shared_ptr<const CodesDataset> dataset =
            argc > 2 ? InMemoryCodesDataset::from_jsonl(argv[2]) : synthetic_dataset(config.data.seed);

        LoaderOptions options;
        options.pad_id = config.data.pad_id;
        options.shuffle = config.data.shuffle;
        DataLoader loader = get_loader(dataset, config.data.num_samples, config.data.batch_size,
                                       config.data.num_workers, config.data.seed, options);
        std::cout << "Number of batches: " << loader.num_batches() << std::endl;

        CodesBatch batch = loader.next_batch();
        const Shape& shape = batch.codes.shape();
        Tensor logits = random_logits({shape[0], shape[1], shape[2], kCardinality}, config.sampling.seed);

        CodebookLoss loss = compute_codebook_loss(logits, batch.codes, batch.mask, config.loss);
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Cross entropy: " << loss.total << std::endl;
        for (size_t k = 0; k < loss.per_codebook.size(); ++k) {
            std::cout << "  codebook " << k << ": " << loss.per_codebook[k] << std::endl;
        }

        // Next-token logits of the last timestep, [B, K, card]
        Tensor last({shape[0], shape[1], kCardinality});
        for (size_t b = 0; b < shape[0]; ++b) {
            for (size_t k = 0; k < shape[1]; ++k) {
                for (size_t c = 0; c < kCardinality; ++c) {
                    last(b, k, c) = logits(b, k, shape[2] - 1, c);
                }
            }
        }

        auto sampler = make_sampler(config.sampling);
        IndexTensor next_tokens = sampler->sample(last);
        for (size_t b = 0; b < shape[0]; ++b) {
            std::ostringstream row;
            for (size_t k = 0; k < shape[1]; ++k) {
                row << (k ? " " : "") << next_tokens(b, k, 0);
            }
            std::cout << "Sample " << batch.indices[b] << " next tokens: " << row.str() << std::endl;
        }
    } catch (const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}
