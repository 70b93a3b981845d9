#include "stt/whisper_gateway.hpp"
#include "audio/audio_utils.hpp"
#include "utils/logging.hpp"
#include "whisper.h"
#include <algorithm>
#include <fstream>

namespace streamscribe {
namespace stt {

namespace {

constexpr double SAMPLES_PER_SECOND = static_cast<double>(audio::INTERNAL_SAMPLE_RATE);

bool parseBool(const std::string& value, bool& result) {
    if (value == "true" || value == "1" || value == "yes") {
        result = true;
    } else if (value == "false" || value == "0" || value == "no") {
        result = false;
    } else {
        return false;
    }
    return true;
}

std::vector<float> sliceAudio(const std::vector<float>& audio, double start, double end) {
    size_t first = std::min(audio.size(), static_cast<size_t>(std::max(0.0, start) * SAMPLES_PER_SECOND));
    size_t last = std::min(audio.size(), static_cast<size_t>(std::max(0.0, end) * SAMPLES_PER_SECOND));
    if (last <= first) {
        return {};
    }
    return std::vector<float>(audio.begin() + first, audio.begin() + last);
}

std::string trimText(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

WhisperGateway::WhisperGateway()
    : nextModelHandle_(1)
    , nextStreamHandle_(1) {
}

WhisperGateway::~WhisperGateway() {
    std::lock_guard<std::mutex> lock(tablesMutex_);
    if (!streams_.empty()) {
        utils::Logger::warn("WhisperGateway destroyed with " + std::to_string(streams_.size()) +
                            " open stream(s)");
    }
    streams_.clear();
    for (auto& entry : models_) {
        if (entry.second->ctx) {
            whisper_free(entry.second->ctx);
            entry.second->ctx = nullptr;
        }
    }
    models_.clear();
}

int32_t WhisperGateway::loadModel(const std::string& path, ModelArch arch,
                                  const std::vector<TranscriberOption>& options,
                                  ModelHandle& model) {
    return guarded("loadModel", [&]() -> int32_t {
        auto state = std::make_shared<ModelState>();
        state->arch = arch;

        std::string error;
        if (!parseOptions(options, state->options, error)) {
            utils::Logger::error("Invalid transcriber option: " + error);
            return STATUS_INVALID_ARGUMENT;
        }

        std::ifstream modelFile(path, std::ios::binary);
        if (!modelFile.good()) {
            utils::Logger::error("Model file not found or not readable: " + path);
            return STATUS_MODEL_LOAD_FAILED;
        }
        modelFile.close();

        whisper_context_params ctx_params = whisper_context_default_params();
        state->ctx = whisper_init_from_file_with_params(path.c_str(), ctx_params);
        if (!state->ctx) {
            utils::Logger::error("Failed to load whisper model from: " + path);
            return STATUS_MODEL_LOAD_FAILED;
        }

        std::lock_guard<std::mutex> lock(tablesMutex_);
        model = nextModelHandle_++;
        models_[model] = state;
        utils::Logger::info("Whisper model " + std::to_string(model) + " loaded from " + path +
                            " (" + modelArchToString(arch) + ", " +
                            std::to_string(state->options.nThreads) + " threads)");
        return STATUS_OK;
    });
}

int32_t WhisperGateway::freeModel(ModelHandle model) {
    return guarded("freeModel", [&]() -> int32_t {
        std::shared_ptr<ModelState> state;
        {
            std::lock_guard<std::mutex> lock(tablesMutex_);
            auto it = models_.find(model);
            if (it == models_.end()) {
                return STATUS_INVALID_HANDLE;
            }
            state = it->second;
            models_.erase(it);
        }

        std::lock_guard<std::mutex> inference(state->inferenceMutex);
        whisper_free(state->ctx);
        state->ctx = nullptr;
        return STATUS_OK;
    });
}

int32_t WhisperGateway::createStream(ModelHandle model, uint32_t flags, StreamHandle& stream) {
    (void)flags;
    return guarded("createStream", [&]() -> int32_t {
        std::lock_guard<std::mutex> lock(tablesMutex_);
        if (models_.find(model) == models_.end()) {
            return STATUS_INVALID_HANDLE;
        }

        auto state = std::make_shared<StreamState>();
        state->model = model;
        stream = nextStreamHandle_++;
        streams_[stream] = state;
        return STATUS_OK;
    });
}

int32_t WhisperGateway::freeStream(ModelHandle model, StreamHandle stream) {
    return guarded("freeStream", [&]() -> int32_t {
        std::lock_guard<std::mutex> lock(tablesMutex_);
        auto it = streams_.find(stream);
        if (it == streams_.end() || it->second->model != model) {
            return STATUS_INVALID_HANDLE;
        }
        streams_.erase(it);
        return STATUS_OK;
    });
}

int32_t WhisperGateway::startStream(ModelHandle model, StreamHandle stream) {
    return guarded("startStream", [&]() -> int32_t {
        std::shared_ptr<StreamState> state;
        int32_t status = findStream(model, stream, state);
        if (status != STATUS_OK) {
            return status;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->active = true;
        state->window.clear();
        state->windowStartTime = 0.0;
        state->newSamples = 0;
        state->lines.reset();
        return STATUS_OK;
    });
}

int32_t WhisperGateway::stopStream(ModelHandle model, StreamHandle stream) {
    return guarded("stopStream", [&]() -> int32_t {
        std::shared_ptr<StreamState> state;
        int32_t status = findStream(model, stream, state);
        if (status != STATUS_OK) {
            return status;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->active = false;
        return STATUS_OK;
    });
}

int32_t WhisperGateway::pushAudio(ModelHandle model, StreamHandle stream,
                                  const std::vector<float>& samples, int32_t sampleRate,
                                  uint32_t flags) {
    (void)flags;
    return guarded("pushAudio", [&]() -> int32_t {
        if (sampleRate <= 0) {
            return STATUS_INVALID_ARGUMENT;
        }

        std::shared_ptr<StreamState> state;
        int32_t status = findStream(model, stream, state);
        if (status != STATUS_OK) {
            return status;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->active) {
            return STATUS_STREAM_NOT_STARTED;
        }

        std::vector<float> resampled = audio::AudioFormatConverter::resample(
            samples, static_cast<uint32_t>(sampleRate), audio::INTERNAL_SAMPLE_RATE);
        state->window.insert(state->window.end(), resampled.begin(), resampled.end());
        state->newSamples += resampled.size();
        return STATUS_OK;
    });
}

int32_t WhisperGateway::transcribeStream(ModelHandle model, StreamHandle stream, uint32_t flags,
                                         Transcript& transcript) {
    return guarded("transcribeStream", [&]() -> int32_t {
        std::shared_ptr<StreamState> state;
        int32_t status = findStream(model, stream, state);
        if (status != STATUS_OK) {
            return status;
        }
        std::shared_ptr<ModelState> modelState;
        status = findModel(model, modelState);
        if (status != STATUS_OK) {
            return status;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        const ModelOptions& options = modelState->options;

        const bool hasNewAudio = state->newSamples > 0;
        const bool longEnough =
            static_cast<double>(state->newSamples) / SAMPLES_PER_SECOND >= options.transcriptionInterval;
        const bool forceUpdate = (flags & FLAG_FORCE_UPDATE) != 0;
        const bool isStopped = !state->active;

        state->lines.clearUpdateFlags();

        // Stopped streams flush whatever audio is still pending.
        if (!((longEnough || forceUpdate || isStopped) && hasNewAudio)) {
            if (isStopped) {
                state->lines.markAllComplete();
            }
            transcript = state->lines.snapshot();
            return STATUS_OK;
        }

        std::vector<Segment> segments;
        status = runInference(*modelState, state->window, segments);
        if (status != STATUS_OK) {
            return status;
        }
        state->newSamples = 0;

        const double windowDuration = static_cast<double>(state->window.size()) / SAMPLES_PER_SECOND;
        const bool windowFull = windowDuration >= options.maxWindowDuration;
        const bool commitAll = windowFull || isStopped;

        std::vector<LineSegment> lineSegments;
        lineSegments.reserve(segments.size());
        for (size_t i = 0; i < segments.size(); ++i) {
            LineSegment line;
            line.text = segments[i].text;
            line.startTime = static_cast<float>(state->windowStartTime + segments[i].start);
            line.duration = static_cast<float>(std::max(0.0, segments[i].end - segments[i].start));
            line.isComplete = commitAll || i + 1 < segments.size();
            if (options.returnAudioData) {
                line.audioData = sliceAudio(state->window, segments[i].start, segments[i].end);
            }
            lineSegments.push_back(std::move(line));
        }
        state->lines.applySegments(lineSegments);

        // Drop audio that now belongs to completed lines.
        size_t committed = 0;
        if (commitAll) {
            committed = state->window.size();
        } else if (segments.size() > 1) {
            const double commitEnd = segments[segments.size() - 2].end;
            committed = std::min(state->window.size(),
                                 static_cast<size_t>(commitEnd * SAMPLES_PER_SECOND));
        }
        if (committed > 0) {
            state->window.erase(state->window.begin(),
                                state->window.begin() + static_cast<std::ptrdiff_t>(committed));
            state->windowStartTime += static_cast<double>(committed) / SAMPLES_PER_SECOND;
        }

        // Lines left open by a short pass lose their audio with the window.
        if (commitAll) {
            state->lines.markAllComplete();
        }
        transcript = state->lines.snapshot();
        return STATUS_OK;
    });
}

int32_t WhisperGateway::transcribeOneShot(ModelHandle model, const std::vector<float>& samples,
                                          int32_t sampleRate, uint32_t flags,
                                          Transcript& transcript) {
    (void)flags;
    return guarded("transcribeOneShot", [&]() -> int32_t {
        transcript = Transcript{};
        if (sampleRate <= 0) {
            return STATUS_INVALID_ARGUMENT;
        }

        std::shared_ptr<ModelState> modelState;
        int32_t status = findModel(model, modelState);
        if (status != STATUS_OK || samples.empty()) {
            return status;
        }

        std::vector<float> audio = audio::AudioFormatConverter::resample(
            samples, static_cast<uint32_t>(sampleRate), audio::INTERNAL_SAMPLE_RATE);

        std::vector<Segment> segments;
        status = runInference(*modelState, audio, segments);
        if (status != STATUS_OK) {
            return status;
        }

        LineTracker lines;
        std::vector<LineSegment> lineSegments;
        for (const Segment& segment : segments) {
            LineSegment line;
            line.text = segment.text;
            line.startTime = static_cast<float>(segment.start);
            line.duration = static_cast<float>(std::max(0.0, segment.end - segment.start));
            line.isComplete = true;
            if (modelState->options.returnAudioData) {
                line.audioData = sliceAudio(audio, segment.start, segment.end);
            }
            lineSegments.push_back(std::move(line));
        }
        lines.applySegments(lineSegments);
        transcript = lines.snapshot();
        return STATUS_OK;
    });
}

std::string WhisperGateway::errorToString(int32_t status) const {
    switch (status) {
        case STATUS_OK: return "success";
        case STATUS_UNKNOWN_ERROR: return "unknown error";
        case STATUS_INVALID_HANDLE: return "invalid handle";
        case STATUS_INVALID_ARGUMENT: return "invalid argument";
        case STATUS_MODEL_LOAD_FAILED: return "failed to load whisper model";
        case STATUS_INFERENCE_FAILED: return "whisper inference failed";
        case STATUS_STREAM_NOT_STARTED: return "stream has not been started";
        default: return "unrecognized status " + std::to_string(status);
    }
}

int32_t WhisperGateway::version() const {
    return GATEWAY_HEADER_VERSION;
}

bool WhisperGateway::parseOptions(const std::vector<TranscriberOption>& options,
                                  ModelOptions& parsed, std::string& error) {
    for (const auto& option : options) {
        try {
            if (option.name == "n_threads") {
                parsed.nThreads = std::max(1, std::stoi(option.value));
            } else if (option.name == "language") {
                parsed.language = option.value;
            } else if (option.name == "transcription_interval") {
                parsed.transcriptionInterval = std::stod(option.value);
            } else if (option.name == "max_window_duration") {
                parsed.maxWindowDuration = std::stod(option.value);
                if (parsed.maxWindowDuration <= 0.0 || parsed.maxWindowDuration > 30.0) {
                    error = "max_window_duration must be in (0, 30] seconds";
                    return false;
                }
            } else if (option.name == "return_audio_data") {
                if (!parseBool(option.value, parsed.returnAudioData)) {
                    error = "return_audio_data expects true or false, got " + option.value;
                    return false;
                }
            } else {
                error = "unknown option '" + option.name + "'";
                return false;
            }
        } catch (const std::exception& e) {
            error = option.name + "=" + option.value + " (" + e.what() + ")";
            return false;
        }
    }
    return true;
}

int32_t WhisperGateway::runInference(ModelState& model, const std::vector<float>& audio,
                                     std::vector<Segment>& segments) {
    segments.clear();
    if (audio.empty()) {
        return STATUS_OK;
    }

    std::lock_guard<std::mutex> lock(model.inferenceMutex);
    if (!model.ctx) {
        return STATUS_INVALID_HANDLE;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = model.options.nThreads;
    params.print_realtime = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.no_context = true;
    params.single_segment = false;
    params.suppress_blank = true;
    if (model.options.language == "auto" || model.options.language.empty()) {
        params.language = nullptr;
        params.detect_language = true;
    } else {
        params.language = model.options.language.c_str();
        params.detect_language = false;
    }

    int result = whisper_full(model.ctx, params, audio.data(), static_cast<int>(audio.size()));
    if (result != 0) {
        utils::Logger::error("Whisper inference failed with code: " + std::to_string(result));
        return STATUS_INFERENCE_FAILED;
    }

    const int n_segments = whisper_full_n_segments(model.ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(model.ctx, i);
        Segment segment;
        segment.text = trimText(text ? text : "");
        // whisper timestamps are in units of 10 ms
        segment.start = static_cast<double>(whisper_full_get_segment_t0(model.ctx, i)) * 0.01;
        segment.end = static_cast<double>(whisper_full_get_segment_t1(model.ctx, i)) * 0.01;
        segments.push_back(std::move(segment));
    }
    return STATUS_OK;
}

int32_t WhisperGateway::findModel(ModelHandle handle, std::shared_ptr<ModelState>& model) {
    std::lock_guard<std::mutex> lock(tablesMutex_);
    auto it = models_.find(handle);
    if (it == models_.end()) {
        return STATUS_INVALID_HANDLE;
    }
    model = it->second;
    return STATUS_OK;
}

int32_t WhisperGateway::findStream(ModelHandle model, StreamHandle handle,
                                   std::shared_ptr<StreamState>& stream) {
    std::lock_guard<std::mutex> lock(tablesMutex_);
    auto it = streams_.find(handle);
    if (it == streams_.end() || it->second->model != model) {
        return STATUS_INVALID_HANDLE;
    }
    stream = it->second;
    return STATUS_OK;
}

int32_t WhisperGateway::guarded(const char* operation, const std::function<int32_t()>& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        utils::Logger::error(std::string("WhisperGateway::") + operation + " failed: " + e.what());
        return STATUS_UNKNOWN_ERROR;
    }
}

} // namespace stt
} // namespace streamscribe
