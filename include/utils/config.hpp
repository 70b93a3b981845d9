#pragma once

#include "stt/inference_gateway.hpp"
#include "utils/logging.hpp"
#include <string>
#include <vector>

namespace streamscribe {
namespace utils {

/**
 * Runtime configuration, read from a JSON document:
 *
 *   {
 *     "logLevel": "INFO",
 *     "model": { "path": "...", "arch": "base", "options": { "n_threads": "4" } },
 *     "streaming": { "updateInterval": 0.5, "chunkDurationMs": 100, "sampleRate": 16000 }
 *   }
 *
 * Every key is optional; missing keys keep their defaults.
 */
class Config {
public:
    Config() = default;

    /**
     * Load from a file. A missing file yields the defaults.
     * @throws ConfigurationException on malformed JSON or invalid values
     */
    static Config load(const std::string& configPath);

    // @throws ConfigurationException on malformed JSON or invalid values
    static Config fromJson(const std::string& json, const std::string& source = "");

    std::string toJson() const;

    LogLevel getLogLevel() const { return logLevel_; }
    const std::string& getModelPath() const { return modelPath_; }
    stt::ModelArch getModelArch() const { return modelArch_; }
    const std::vector<stt::TranscriberOption>& getModelOptions() const { return modelOptions_; }
    double getUpdateInterval() const { return updateInterval_; }
    int getChunkDurationMs() const { return chunkDurationMs_; }
    int getSampleRate() const { return sampleRate_; }

    void setLogLevel(LogLevel level) { logLevel_ = level; }
    void setModelPath(const std::string& path) { modelPath_ = path; }
    void setModelArch(stt::ModelArch arch) { modelArch_ = arch; }
    void setModelOption(const std::string& name, const std::string& value);
    void setUpdateInterval(double seconds) { updateInterval_ = seconds; }
    void setChunkDurationMs(int ms) { chunkDurationMs_ = ms; }
    void setSampleRate(int rate) { sampleRate_ = rate; }

    // @throws ConfigurationException naming the first invalid value
    void validate() const;

private:
    LogLevel logLevel_ = LogLevel::INFO;
    std::string modelPath_;
    stt::ModelArch modelArch_ = stt::ModelArch::BASE;
    std::vector<stt::TranscriberOption> modelOptions_;
    double updateInterval_ = 0.5;
    int chunkDurationMs_ = 100;
    int sampleRate_ = 16000;
};

} // namespace utils
} // namespace streamscribe
