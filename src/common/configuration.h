#ifndef RELOADED_CONFIGURATION_H_
#define RELOADED_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace Reloaded {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ReloadedConfig {
    // Step/tick shape of a run
    struct Simulation {
        ConfigValue<std::string> homeserver_url{"localhost", "RELOADED_HOMESERVER_URL"};
        ConfigValue<std::string> output_dir{"output", "RELOADED_OUTPUT_DIR"};
        ConfigValue<size_t> total_steps{1, "RELOADED_TOTAL_STEPS"};
        ConfigValue<size_t> users_per_step{10, "RELOADED_USERS_PER_STEP"};
        ConfigValue<double> friendship_ratio{0.1, "RELOADED_FRIENDSHIP_RATIO"};
        ConfigValue<size_t> step_duration_ms{60000, "RELOADED_STEP_DURATION_MS"};
        ConfigValue<size_t> tick_duration_ms{1000, "RELOADED_TICK_DURATION_MS"};
        ConfigValue<size_t> max_users_to_act_per_tick{100, "RELOADED_MAX_USERS_PER_TICK"};
        ConfigValue<size_t> waiting_period_secs{30, "RELOADED_WAITING_PERIOD_SECS"};
        // 0 sizes the tick pool from max_users_to_act_per_tick
        ConfigValue<size_t> worker_threads{0, "RELOADED_WORKER_THREADS"};
    } simulation;

    struct Retry {
        ConfigValue<bool> retry_request_config{true, "RELOADED_RETRY_REQUEST_CONFIG"};
        ConfigValue<size_t> user_creation_retry_attempts{3, "RELOADED_USER_CREATION_RETRY_ATTEMPTS"};
        ConfigValue<size_t> room_creation_retry_attempts{3, "RELOADED_ROOM_CREATION_RETRY_ATTEMPTS"};
    } retry;

    struct Throughput {
        ConfigValue<size_t> user_creation_throughput{50, "RELOADED_USER_CREATION_THROUGHPUT"};
        ConfigValue<size_t> room_creation_throughput{50, "RELOADED_ROOM_CREATION_THROUGHPUT"};
    } throughput;

    struct State {
        ConfigValue<std::string> users_filename{"users.yaml", "RELOADED_USERS_FILENAME"};
    } state;

    // In-process homeserver the driver runs against
    struct Homeserver {
        ConfigValue<size_t> latency_ms{0, "RELOADED_HOMESERVER_LATENCY_MS"};
        ConfigValue<double> failure_rate{0.0, "RELOADED_HOMESERVER_FAILURE_RATE"};
        ConfigValue<size_t> seed{0, "RELOADED_HOMESERVER_SEED"};
    } homeserver;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const ReloadedConfig& config() const { return config_; }
    ReloadedConfig& config() { return config_; }

    // Drops every loaded value back to the built-in defaults
    void reset() { config_ = ReloadedConfig{}; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    static std::vector<std::string> Validate(const ReloadedConfig& config);

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ReloadedConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile/loadFromString; node is a YAML::Node
    void parseYAMLNode(const void* node);
};

// Template specializations for getEnvValue
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Reloaded

#endif // RELOADED_CONFIGURATION_H_
