#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include "audio/audio_utils.hpp"
#include "audio/wav_codec.hpp"
#include "stt/transcriber.hpp"
#include "stt/whisper_gateway.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace streamscribe;

namespace {

struct CommandLine {
    std::string configPath = "config/streamscribe.json";
    std::string modelPath;
    std::string arch;
    std::string saveInputPath;
    std::string logLevel;
    bool streaming = false;
    std::vector<std::string> inputs;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <file.wav>...\n"
              << "Options:\n"
              << "  --config <file>      JSON configuration (default: config/streamscribe.json)\n"
              << "  --model <path>       Whisper model file, overrides model.path\n"
              << "  --arch <name>        Model architecture, overrides model.arch\n"
              << "  --stream             Feed audio through a streaming session\n"
              << "  --save-input <file>  Write the decoded mono input to a 16-bit WAV\n"
              << "  --log-level <level>  DEBUG, INFO, WARN, ERROR or OFF\n"
              << "  --help, -h           Show this help message\n";
}

// Returns false when the program should exit without transcribing.
bool parseArguments(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto nextValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw utils::ConfigurationException("Missing value for " + name, "command line");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            cmd.configPath = nextValue(arg);
        } else if (arg == "--model") {
            cmd.modelPath = nextValue(arg);
        } else if (arg == "--arch") {
            cmd.arch = nextValue(arg);
        } else if (arg == "--save-input") {
            cmd.saveInputPath = nextValue(arg);
        } else if (arg == "--log-level") {
            cmd.logLevel = nextValue(arg);
        } else if (arg == "--stream") {
            cmd.streaming = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            throw utils::ConfigurationException("Unknown option " + arg, "command line");
        } else {
            cmd.inputs.push_back(arg);
        }
    }

    if (cmd.inputs.empty()) {
        printUsage(argv[0]);
        return false;
    }
    return true;
}

void applyOverrides(const CommandLine& cmd, utils::Config& config) {
    if (!cmd.modelPath.empty()) {
        config.setModelPath(cmd.modelPath);
    }
    if (!cmd.arch.empty()) {
        stt::ModelArch arch;
        if (!stt::modelArchFromString(cmd.arch, arch)) {
            throw utils::ConfigurationException("Unknown model architecture '" + cmd.arch + "'",
                                                "command line");
        }
        config.setModelArch(arch);
    }
    if (!cmd.logLevel.empty()) {
        utils::LogLevel level;
        if (!utils::Logger::levelFromString(cmd.logLevel, level)) {
            throw utils::ConfigurationException("Unknown log level '" + cmd.logLevel + "'",
                                                "command line");
        }
        config.setLogLevel(level);
    }
    if (config.getModelPath().empty()) {
        throw utils::ConfigurationException("No model path configured (use --model)");
    }
}

void printEvent(const stt::TranscriptEvent& event) {
    switch (stt::eventType(event)) {
        case stt::TranscriptEventType::LINE_STARTED:
        case stt::TranscriptEventType::LINE_UPDATED:
            utils::Logger::debug(stt::describeEvent(event));
            break;
        case stt::TranscriptEventType::LINE_TEXT_CHANGED:
            std::cout << "  ... " << stt::eventLine(event)->text << std::endl;
            break;
        case stt::TranscriptEventType::LINE_COMPLETED: {
            const stt::TranscriptLine* line = stt::eventLine(event);
            std::cout << "[" << line->startTime << "s] " << line->text << std::endl;
            break;
        }
        case stt::TranscriptEventType::ERROR:
            utils::Logger::error(stt::describeEvent(event));
            break;
    }
}

void transcribeStreaming(stt::Transcriber& transcriber, const audio::WavData& wav,
                         const utils::Config& config) {
    auto session = transcriber.createStream(config.getUpdateInterval());
    session->addListener(stt::TranscriptEventCallback(printEvent));
    session->start();

    size_t chunkSize = audio::AudioFormatConverter::samplesForDuration(
        wav.sampleRate, static_cast<uint32_t>(config.getChunkDurationMs()));
    for (const auto& chunk : audio::AudioFormatConverter::splitIntoChunks(wav.samples, chunkSize)) {
        session->addAudio(chunk, static_cast<int32_t>(wav.sampleRate));
    }

    session->stop();
    session->close();
}

void transcribeFile(stt::Transcriber& transcriber, const std::string& path,
                    const CommandLine& cmd, const utils::Config& config) {
    audio::WavData wav = audio::WavDecoder::loadFile(path);
    utils::Logger::info(path + ": " + std::to_string(wav.durationSeconds()) + "s, " +
                        std::to_string(wav.sampleRate) + " Hz, " +
                        std::to_string(wav.channels) + " channel(s), " +
                        std::to_string(wav.bitsPerSample) + "-bit");

    if (!cmd.saveInputPath.empty()) {
        audio::WavEncoder::saveFile(cmd.saveInputPath, wav.samples, wav.sampleRate);
    }

    std::cout << "== " << path << std::endl;
    if (cmd.streaming) {
        transcribeStreaming(transcriber, wav, config);
        return;
    }

    stt::Transcript transcript = transcriber.transcribeWithoutStreaming(
        wav.samples, static_cast<int32_t>(wav.sampleRate));
    std::cout << transcript.toString();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        CommandLine cmd;
        if (!parseArguments(argc, argv, cmd)) {
            return 0;
        }

        auto config = utils::Config::load(cmd.configPath);
        applyOverrides(cmd, config);
        utils::Logger::setLevel(config.getLogLevel());

        auto gateway = std::make_shared<stt::WhisperGateway>();
        stt::Transcriber transcriber(gateway, config.getModelPath(), config.getModelArch(),
                                     config.getModelOptions());
        utils::Logger::debug("Gateway version " + std::to_string(transcriber.version()));

        int failures = 0;
        for (const auto& path : cmd.inputs) {
            try {
                transcribeFile(transcriber, path, cmd, config);
            } catch (const utils::AudioDecodeException& e) {
                HANDLE_EXCEPTION(e, path);
                ++failures;
            }
        }

        transcriber.close();
        return failures == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
