#include "alm/runtime/init.hpp"
#include "alm/utils/logging.hpp"
#include <fstream>
#include <stdexcept>

namespace alm::runtime {

SystemState& SystemState::get_instance() {
    static SystemState instance;
    return instance;
}

void SystemState::initialize(const std::filesystem::path& config_path) {
    std::ifstream f(config_path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + config_path.string() + ": " + e.what());
    }

    initialize_from_json(config);
    logging::info("Loaded config from " + config_path.string());
}

void SystemState::initialize_from_json(const nlohmann::json& config) {
    RunConfig parsed = config.get<RunConfig>();
    parsed.validate();

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    run_config_ = parsed;
    initialized_ = true;
}

bool SystemState::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

nlohmann::json SystemState::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

RunConfig SystemState::run_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_config_;
}

std::string SystemState::get_string(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.contains(key)) {
        throw std::runtime_error("Config key not found: " + key);
    }

    if (!config_[key].is_string()) {
        throw std::runtime_error("Config value is not a string: " + key);
    }

    return config_[key].get<std::string>();
}

int SystemState::get_int(const std::string& key, int default_val) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.contains(key)) {
        return default_val;
    }

    if (!config_[key].is_number()) {
        throw std::runtime_error("Config value is not a number: " + key);
    }

    return config_[key].get<int>();
}

} // namespace alm::runtime
