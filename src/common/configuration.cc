#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Rendezvous {

// Template specializations for environment variable parsing
template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoll(env_val);
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
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return std::tolower(c); });
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

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["rendezvous"]) {
        LOG(WARNING) << "Configuration has no 'rendezvous' section, keeping defaults";
        return;
    }
    auto root = yaml["rendezvous"];

    if (root["data"]) {
        auto data = root["data"];
        if (data["path"]) config_.data.path.set(data["path"].as<std::string>());
    }

    if (root["prompt"]) {
        auto prompt = root["prompt"];
        if (prompt["text"]) config_.prompt.text.set(prompt["text"].as<std::string>());
        if (prompt["lenient"]) config_.prompt.lenient.set(prompt["lenient"].as<bool>());
    }

    if (root["pipeline"]) {
        auto pipeline = root["pipeline"];
        if (pipeline["mode"]) config_.pipeline.mode.set(pipeline["mode"].as<std::string>());
        if (pipeline["worker_threads"]) config_.pipeline.worker_threads.set(pipeline["worker_threads"].as<int64_t>());
        if (pipeline["timeout_ms"]) config_.pipeline.timeout_ms.set(pipeline["timeout_ms"].as<int64_t>());
    }

    if (root["conversation"]) {
        auto conversation = root["conversation"];
        if (conversation["shutdown_delay_ms"]) {
            config_.conversation.shutdown_delay_ms.set(conversation["shutdown_delay_ms"].as<int64_t>());
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        LOG(INFO) << "Loaded configuration from " << filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.data.path.get().empty()) {
        validation_errors_.push_back("Data path must not be empty");
    }

    const std::string mode = config_.pipeline.mode.get();
    if (mode != "sequential" && mode != "joined" && mode != "actor") {
        validation_errors_.push_back("Pipeline mode must be one of sequential, joined, actor (got '" + mode + "')");
    }

    // Both providers must be able to run at the same time
    if (config_.pipeline.worker_threads.get() < kMinWorkerThreads) {
        validation_errors_.push_back("Worker threads must be at least " + std::to_string(kMinWorkerThreads));
    }

    if (config_.pipeline.timeout_ms.get() < 0) {
        validation_errors_.push_back("Timeout must not be negative");
    }

    if (config_.conversation.shutdown_delay_ms.get() < 0) {
        validation_errors_.push_back("Shutdown delay must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Rendezvous
