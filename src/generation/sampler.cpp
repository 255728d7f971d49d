#include "alm/generation/sampler.hpp"
#include "alm/generation/greedy_sampler.hpp"
#include "alm/generation/random_sampler.hpp"
#include "alm/generation/topk_sampler.hpp"
#include "alm/generation/topp_sampler.hpp"
#include "alm/utils/logging.hpp"

namespace alm {

std::unique_ptr<Sampler> make_sampler(const SamplingConfig& config) {
    config.validate();

    if (!config.use_sampling) {
        logging::debug("Using greedy sampler");
        return std::make_unique<GreedySampler>();
    }
    if (config.top_p > 0.0f) {
        logging::debug("Using top-p sampler, p=" + std::to_string(config.top_p));
        return std::make_unique<TopPSampler>(config.top_p, config.temperature, config.seed);
    }
    if (config.top_k > 0) {
        logging::debug("Using top-k sampler, k=" + std::to_string(config.top_k));
        return std::make_unique<TopKSampler>(config.top_k, config.temperature, config.seed);
    }
    logging::debug("Using random sampler");
    return std::make_unique<RandomSampler>(config.temperature, config.seed);
}

} // namespace alm
