#include "scripted_gateway.hpp"

using namespace streamscribe;

namespace fixtures {

ScriptedGateway::ScriptedGateway(uint64_t firstLineId)
    : firstLineId_(firstLineId) {
}

void ScriptedGateway::scriptPass(stt::StreamHandle stream, const Pass& pass) {
    auto it = streams_.find(stream);
    if (it != streams_.end()) {
        it->second.passes.push_back(pass);
    } else {
        pendingScripts_[stream].push_back(pass);
    }
}

void ScriptedGateway::scriptOneShot(const std::vector<std::string>& lines) {
    oneShotLines_ = lines;
}

void ScriptedGateway::failNext(const std::string& operation, int32_t status) {
    failures_[operation] = status;
}

size_t ScriptedGateway::pushedSamples(stt::StreamHandle stream) const {
    auto it = streams_.find(stream);
    return it == streams_.end() ? 0 : it->second.totalSamples;
}

int32_t ScriptedGateway::loadModel(const std::string& path, stt::ModelArch arch,
                                   const std::vector<stt::TranscriberOption>& options,
                                   stt::ModelHandle& model) {
    (void)arch;
    (void)options;
    int32_t status;
    if (takeFailure("loadModel", status)) {
        return status;
    }
    if (path.empty()) {
        return stt::STATUS_INVALID_ARGUMENT;
    }
    model = nextModel_++;
    models_[model] = true;
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::freeModel(stt::ModelHandle model) {
    int32_t status;
    if (takeFailure("freeModel", status)) {
        return status;
    }
    return models_.erase(model) == 1 ? stt::STATUS_OK : stt::STATUS_INVALID_HANDLE;
}

int32_t ScriptedGateway::createStream(stt::ModelHandle model, uint32_t flags,
                                      stt::StreamHandle& stream) {
    (void)flags;
    int32_t status;
    if (takeFailure("createStream", status)) {
        return status;
    }
    if (models_.count(model) == 0) {
        return stt::STATUS_INVALID_HANDLE;
    }

    stream = nextStream_++;
    Stream state;
    state.model = model;
    state.lines = stt::LineTracker(firstLineId_);
    auto scripted = pendingScripts_.find(stream);
    if (scripted != pendingScripts_.end()) {
        state.passes = scripted->second;
        pendingScripts_.erase(scripted);
    }
    streams_[stream] = std::move(state);
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::freeStream(stt::ModelHandle model, stt::StreamHandle stream) {
    int32_t status;
    if (takeFailure("freeStream", status)) {
        return status;
    }
    if (!find(model, stream)) {
        return stt::STATUS_INVALID_HANDLE;
    }
    streams_.erase(stream);
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::startStream(stt::ModelHandle model, stt::StreamHandle stream) {
    int32_t status;
    if (takeFailure("startStream", status)) {
        return status;
    }
    Stream* state = find(model, stream);
    if (!state) {
        return stt::STATUS_INVALID_HANDLE;
    }
    state->active = true;
    state->pendingSamples = 0;
    state->lines.reset();
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::stopStream(stt::ModelHandle model, stt::StreamHandle stream) {
    int32_t status;
    if (takeFailure("stopStream", status)) {
        return status;
    }
    Stream* state = find(model, stream);
    if (!state) {
        return stt::STATUS_INVALID_HANDLE;
    }
    state->active = false;
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::pushAudio(stt::ModelHandle model, stt::StreamHandle stream,
                                   const std::vector<float>& samples, int32_t sampleRate,
                                   uint32_t flags) {
    (void)flags;
    int32_t status;
    if (takeFailure("pushAudio", status)) {
        return status;
    }
    Stream* state = find(model, stream);
    if (!state) {
        return stt::STATUS_INVALID_HANDLE;
    }
    if (sampleRate <= 0 || !state->active) {
        return stt::STATUS_INVALID_ARGUMENT;
    }
    state->pendingSamples += samples.size();
    state->totalSamples += samples.size();
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::transcribeStream(stt::ModelHandle model, stt::StreamHandle stream,
                                          uint32_t flags, stt::Transcript& transcript) {
    ++transcribeCalls_;
    int32_t status;
    if (takeFailure("transcribeStream", status)) {
        return status;
    }
    Stream* state = find(model, stream);
    if (!state) {
        return stt::STATUS_INVALID_HANDLE;
    }

    state->lines.clearUpdateFlags();
    const bool force = (flags & stt::FLAG_FORCE_UPDATE) != 0;
    if ((state->pendingSamples > 0 || force) && !state->passes.empty()) {
        state->lines.applySegments(state->passes.front());
        state->passes.pop_front();
        state->pendingSamples = 0;
    }
    if (!state->active) {
        state->lines.markAllComplete();
    }
    transcript = state->lines.snapshot();
    return stt::STATUS_OK;
}

int32_t ScriptedGateway::transcribeOneShot(stt::ModelHandle model, const std::vector<float>& samples,
                                           int32_t sampleRate, uint32_t flags,
                                           stt::Transcript& transcript) {
    (void)flags;
    int32_t status;
    if (takeFailure("transcribeOneShot", status)) {
        return status;
    }
    if (models_.count(model) == 0) {
        return stt::STATUS_INVALID_HANDLE;
    }

    transcript = stt::Transcript{};
    if (samples.empty()) {
        return stt::STATUS_OK;
    }

    const float total = static_cast<float>(samples.size()) / static_cast<float>(sampleRate);
    const float each = oneShotLines_.empty() ? 0.0f : total / static_cast<float>(oneShotLines_.size());
    stt::LineTracker lines(firstLineId_);
    Pass pass;
    for (size_t i = 0; i < oneShotLines_.size(); ++i) {
        stt::LineSegment segment;
        segment.text = oneShotLines_[i];
        segment.startTime = each * static_cast<float>(i);
        segment.duration = each;
        segment.isComplete = true;
        pass.push_back(segment);
    }
    lines.applySegments(pass);
    transcript = lines.snapshot();
    return stt::STATUS_OK;
}

std::string ScriptedGateway::errorToString(int32_t status) const {
    switch (status) {
        case stt::STATUS_OK: return "success";
        case stt::STATUS_UNKNOWN_ERROR: return "unknown error";
        case stt::STATUS_INVALID_HANDLE: return "invalid handle";
        case stt::STATUS_INVALID_ARGUMENT: return "invalid argument";
        default: return "scripted failure " + std::to_string(status);
    }
}

bool ScriptedGateway::takeFailure(const std::string& operation, int32_t& status) {
    auto it = failures_.find(operation);
    if (it == failures_.end()) {
        return false;
    }
    status = it->second;
    failures_.erase(it);
    return true;
}

ScriptedGateway::Stream* ScriptedGateway::find(stt::ModelHandle model, stt::StreamHandle stream) {
    auto it = streams_.find(stream);
    if (it == streams_.end() || it->second.model != model) {
        return nullptr;
    }
    return &it->second;
}

} // namespace fixtures
