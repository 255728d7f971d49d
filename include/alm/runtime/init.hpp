#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace alm::runtime {

class SystemState {
public:
    // Singleton access
    static SystemState& get_instance();

    // Load and validate a JSON config file
    void initialize(const std::filesystem::path& config_path);

    // Same, from an already parsed document
    void initialize_from_json(const nlohmann::json& config);

    bool is_initialized() const;

    // Raw document and typed view; both empty/default until initialized
    nlohmann::json config() const;
    RunConfig run_config() const;

    std::string get_string(const std::string& key) const;
    int get_int(const std::string& key, int default_val = 0) const;

private:
    SystemState() = default;

    mutable std::mutex mutex_;
    nlohmann::json config_;
    RunConfig run_config_;
    bool initialized_ = false;
};

} // namespace alm::runtime
