#ifndef RENDEZVOUS_CONFIGURATION_H_
#define RENDEZVOUS_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Rendezvous {

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
struct RendezvousConfig {
    // Data file
    struct Data {
        ConfigValue<std::string> path{kDefaultDataPath, "RENDEZVOUS_DATA_PATH"};
    } data;

    // Adjustment prompt
    struct Prompt {
        ConfigValue<std::string> text{kDefaultPrompt, "RENDEZVOUS_PROMPT_TEXT"};
        // Invalid answers become 0 instead of failing the run.
        ConfigValue<bool> lenient{false, "RENDEZVOUS_PROMPT_LENIENT"};
    } prompt;

    struct Pipeline {
        // Supported modes: sequential, joined, actor
        ConfigValue<std::string> mode{"joined", "RENDEZVOUS_PIPELINE_MODE"};
        ConfigValue<int64_t> worker_threads{kDefaultWorkerThreads, "RENDEZVOUS_WORKER_THREADS"};
        ConfigValue<int64_t> timeout_ms{kDefaultTimeoutMs, "RENDEZVOUS_TIMEOUT_MS"};
    } pipeline;

    struct Conversation {
        ConfigValue<int64_t> shutdown_delay_ms{kDefaultShutdownDelayMs, "RENDEZVOUS_SHUTDOWN_DELAY_MS"};
    } conversation;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file. False only when the file cannot be read or
    // parsed; call validate() once every source has been applied.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Drop everything loaded or set so far
    void resetToDefaults() { config_ = RendezvousConfig{}; }

    // Get the configuration
    const RendezvousConfig& config() const { return config_; }
    RendezvousConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getDataPath() const { return config_.data.path.get(); }
    std::string getMode() const { return config_.pipeline.mode.get(); }
    int64_t getWorkerThreads() const { return config_.pipeline.worker_threads.get(); }
    int64_t getTimeoutMs() const { return config_.pipeline.timeout_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    RendezvousConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Rendezvous

#endif // RENDEZVOUS_CONFIGURATION_H_
