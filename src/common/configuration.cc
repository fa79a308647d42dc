#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Reloaded {

// Template specializations for environment variable parsing
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAMLNode(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["reloaded"]) {
        LOG(WARNING) << "Configuration has no 'reloaded' section, keeping defaults";
        return;
    }
    auto root = yaml["reloaded"];

    // Simulation
    if (root["simulation"]) {
        auto sim = root["simulation"];
        if (sim["homeserver_url"]) config_.simulation.homeserver_url.set(sim["homeserver_url"].as<std::string>());
        if (sim["output_dir"]) config_.simulation.output_dir.set(sim["output_dir"].as<std::string>());
        if (sim["total_steps"]) config_.simulation.total_steps.set(sim["total_steps"].as<size_t>());
        if (sim["users_per_step"]) config_.simulation.users_per_step.set(sim["users_per_step"].as<size_t>());
        if (sim["friendship_ratio"]) config_.simulation.friendship_ratio.set(sim["friendship_ratio"].as<double>());
        if (sim["step_duration_ms"]) config_.simulation.step_duration_ms.set(sim["step_duration_ms"].as<size_t>());
        if (sim["tick_duration_ms"]) config_.simulation.tick_duration_ms.set(sim["tick_duration_ms"].as<size_t>());
        if (sim["max_users_to_act_per_tick"]) config_.simulation.max_users_to_act_per_tick.set(sim["max_users_to_act_per_tick"].as<size_t>());
        if (sim["waiting_period_secs"]) config_.simulation.waiting_period_secs.set(sim["waiting_period_secs"].as<size_t>());
        if (sim["worker_threads"]) config_.simulation.worker_threads.set(sim["worker_threads"].as<size_t>());
    }

    // Retry
    if (root["retry"]) {
        auto retry = root["retry"];
        if (retry["retry_request_config"]) config_.retry.retry_request_config.set(retry["retry_request_config"].as<bool>());
        if (retry["user_creation_retry_attempts"]) config_.retry.user_creation_retry_attempts.set(retry["user_creation_retry_attempts"].as<size_t>());
        if (retry["room_creation_retry_attempts"]) config_.retry.room_creation_retry_attempts.set(retry["room_creation_retry_attempts"].as<size_t>());
    }

    // Throughput
    if (root["throughput"]) {
        auto throughput = root["throughput"];
        if (throughput["user_creation_throughput"]) config_.throughput.user_creation_throughput.set(throughput["user_creation_throughput"].as<size_t>());
        if (throughput["room_creation_throughput"]) config_.throughput.room_creation_throughput.set(throughput["room_creation_throughput"].as<size_t>());
    }

    // State
    if (root["state"]) {
        auto state = root["state"];
        if (state["users_filename"]) config_.state.users_filename.set(state["users_filename"].as<std::string>());
    }

    // Homeserver
    if (root["homeserver"]) {
        auto hs = root["homeserver"];
        if (hs["latency_ms"]) config_.homeserver.latency_ms.set(hs["latency_ms"].as<size_t>());
        if (hs["failure_rate"]) config_.homeserver.failure_rate.set(hs["failure_rate"].as<double>());
        if (hs["seed"]) config_.homeserver.seed.set(hs["seed"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAMLNode(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

std::vector<std::string> Configuration::Validate(const ReloadedConfig& config) {
    std::vector<std::string> errors;

    if (config.simulation.homeserver_url.get().empty()) {
        errors.push_back("Homeserver url must not be empty");
    }

    if (config.simulation.total_steps.get() < 1) {
        errors.push_back("Total steps must be at least 1");
    }

    if (config.simulation.users_per_step.get() < 1) {
        errors.push_back("Users per step must be at least 1");
    }

    double ratio = config.simulation.friendship_ratio.get();
    if (!(ratio > 0.0 && ratio <= 1.0)) {
        errors.push_back("Friendship ratio must be in (0, 1]");
    }

    // Tick/step timing
    size_t tick_ms = config.simulation.tick_duration_ms.get();
    if (tick_ms == 0) {
        errors.push_back("Tick duration must be greater than 0");
    }
    if (config.simulation.step_duration_ms.get() < tick_ms) {
        errors.push_back("Step duration cannot be shorter than tick duration");
    }

    if (config.simulation.max_users_to_act_per_tick.get() < 1) {
        errors.push_back("Max users to act per tick must be at least 1");
    }

    if (config.throughput.user_creation_throughput.get() < 1 ||
        config.throughput.room_creation_throughput.get() < 1) {
        errors.push_back("Creation throughputs must be at least 1");
    }

    if (config.retry.user_creation_retry_attempts.get() < 1 ||
        config.retry.room_creation_retry_attempts.get() < 1) {
        errors.push_back("Retry attempts must be at least 1");
    }

    double failure_rate = config.homeserver.failure_rate.get();
    if (failure_rate < 0.0 || failure_rate >= 1.0) {
        errors.push_back("Homeserver failure rate must be in [0, 1)");
    }

    return errors;
}

bool Configuration::validate() const {
    validation_errors_ = Validate(config_);
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Reloaded
