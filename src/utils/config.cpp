#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace streamscribe {
namespace utils {

namespace {

std::string optionValueToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number() || value.is_null()) {
        return value.dump();
    }
    throw ConfigurationException("Model option values must be scalars, got " + value.dump());
}

} // namespace

Config Config::load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        Logger::warn("Configuration file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Config config = fromJson(buffer.str(), configPath);
    Logger::info("Configuration loaded from " + configPath);
    return config;
}

Config Config::fromJson(const std::string& json, const std::string& source) {
    Config config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("JSON parsing error: " + std::string(e.what()), source);
    }
    if (!j.is_object()) {
        throw ConfigurationException("Configuration root must be an object", source);
    }

    try {
        if (j.contains("logLevel")) {
            const std::string name = j["logLevel"].get<std::string>();
            if (!Logger::levelFromString(name, config.logLevel_)) {
                throw ConfigurationException("Unknown log level '" + name + "'", source);
            }
        }

        if (j.contains("model")) {
            const auto& model = j["model"];
            config.modelPath_ = model.value("path", config.modelPath_);

            if (model.contains("arch")) {
                const std::string arch = model["arch"].get<std::string>();
                if (!stt::modelArchFromString(arch, config.modelArch_)) {
                    throw ConfigurationException("Unknown model architecture '" + arch + "'", source);
                }
            }

            if (model.contains("options")) {
                for (const auto& item : model["options"].items()) {
                    config.setModelOption(item.key(), optionValueToString(item.value()));
                }
            }
        }

        if (j.contains("streaming")) {
            const auto& streaming = j["streaming"];
            config.updateInterval_ = streaming.value("updateInterval", config.updateInterval_);
            config.chunkDurationMs_ = streaming.value("chunkDurationMs", config.chunkDurationMs_);
            config.sampleRate_ = streaming.value("sampleRate", config.sampleRate_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("Invalid configuration value: " + std::string(e.what()), source);
    }

    config.validate();
    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;
    j["logLevel"] = Logger::levelToString(logLevel_);

    nlohmann::json options = nlohmann::json::object();
    for (const auto& option : modelOptions_) {
        options[option.name] = option.value;
    }
    j["model"] = {
        {"path", modelPath_},
        {"arch", stt::modelArchToString(modelArch_)},
        {"options", options}
    };

    j["streaming"] = {
        {"updateInterval", updateInterval_},
        {"chunkDurationMs", chunkDurationMs_},
        {"sampleRate", sampleRate_}
    };
    return j.dump(2);
}

void Config::setModelOption(const std::string& name, const std::string& value) {
    for (auto& option : modelOptions_) {
        if (option.name == name) {
            option.value = value;
            return;
        }
    }
    modelOptions_.push_back({name, value});
}

void Config::validate() const {
    if (!(updateInterval_ > 0.0)) {
        throw ConfigurationException("streaming.updateInterval must be positive");
    }
    if (chunkDurationMs_ <= 0) {
        throw ConfigurationException("streaming.chunkDurationMs must be positive");
    }
    if (sampleRate_ <= 0) {
        throw ConfigurationException("streaming.sampleRate must be positive");
    }
}

} // namespace utils
} // namespace streamscribe
