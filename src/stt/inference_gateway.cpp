#include "stt/inference_gateway.hpp"
#include <algorithm>
#include <cctype>

namespace streamscribe {
namespace stt {

namespace {

std::string normalizeArchName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') {
            result.push_back('_');
        } else {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

} // namespace

std::string modelArchToString(ModelArch arch) {
    switch (arch) {
        case ModelArch::TINY: return "tiny";
        case ModelArch::BASE: return "base";
        case ModelArch::TINY_STREAMING: return "tiny_streaming";
        case ModelArch::BASE_STREAMING: return "base_streaming";
        case ModelArch::SMALL_STREAMING: return "small_streaming";
        case ModelArch::MEDIUM_STREAMING: return "medium_streaming";
    }
    return "unknown";
}

bool modelArchFromString(const std::string& name, ModelArch& arch) {
    static const ModelArch all[] = {
        ModelArch::TINY, ModelArch::BASE, ModelArch::TINY_STREAMING,
        ModelArch::BASE_STREAMING, ModelArch::SMALL_STREAMING, ModelArch::MEDIUM_STREAMING
    };

    const std::string normalized = normalizeArchName(name);
    for (ModelArch candidate : all) {
        if (modelArchToString(candidate) == normalized) {
            arch = candidate;
            return true;
        }
    }
    return false;
}

utils::GatewayErrorCode gatewayErrorCodeFromStatus(int32_t status) {
    switch (status) {
        case STATUS_UNKNOWN_ERROR: return utils::GatewayErrorCode::UNKNOWN;
        case STATUS_INVALID_HANDLE: return utils::GatewayErrorCode::INVALID_HANDLE;
        case STATUS_INVALID_ARGUMENT: return utils::GatewayErrorCode::INVALID_ARGUMENT;
        default: return utils::GatewayErrorCode::CUSTOM;
    }
}

void checkGatewayStatus(const InferenceGateway& gateway, int32_t status,
                        const std::string& operation) {
    // Only negative statuses are failures.
    if (status >= STATUS_OK) {
        return;
    }

    utils::GatewayErrorCode code = gatewayErrorCodeFromStatus(status);
    std::string description = gateway.errorToString(status);
    if (description.empty()) {
        description = utils::gatewayErrorCodeToString(code);
    }

    throw utils::GatewayException(code, status,
                                  operation + " failed (" + std::to_string(status) + "): " +
                                  description, operation);
}

} // namespace stt
} // namespace streamscribe
