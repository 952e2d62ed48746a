#include "AppConfig.hpp"

#include "../Codec/SegmentEncoder.hpp"
#include "../TranscriptionClient/EndpointUrl.hpp"
#include "../common/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace chunkscribe {

namespace {

template <typename T>
void ReadField(const nlohmann::json& section, const char* key, T& target, const std::string& path) {
    if (!section.contains(key)) {
        return;
    }
    const nlohmann::json& value = section.at(key);
    if constexpr (std::is_unsigned<T>::value) {
        if (!value.is_number_unsigned()) {
            throw ConfigError("Invalid value for " + path + "." + key + ": expected a non-negative integer");
        }
        // get<T>() молча обрезает значения больше T
        if (value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            throw ConfigError("Invalid value for " + path + "." + key + ": out of range");
        }
    }
    try {
        target = value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid value for " + path + "." + key + ": " + e.what());
    }
}

const nlohmann::json* GetSection(const nlohmann::json& root, const char* name) {
    if (!root.contains(name)) {
        return nullptr;
    }
    const nlohmann::json& section = root.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("Section '") + name + "' must be an object");
    }
    return &section;
}

} // namespace

AppConfig AppConfig::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Could not open config file: " + path);
    }
    std::stringstream text;
    text << file.rdbuf();
    return Parse(text.str());
}

AppConfig AppConfig::Parse(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    AppConfig config;

    if (const nlohmann::json* endpoint = GetSection(root, "endpoint")) {
        ReadField(*endpoint, "url", config.endpoint.url, "endpoint");
        ReadField(*endpoint, "timeout_ms", config.endpoint.timeoutMs, "endpoint");
    }

    if (const nlohmann::json* capture = GetSection(root, "capture")) {
        ReadField(*capture, "device_id", config.capture.deviceId, "capture");
        ReadField(*capture, "sample_rate", config.capture.sampleRate, "capture");
        ReadField(*capture, "channels", config.capture.channels, "capture");
        ReadField(*capture, "segment_interval_ms", config.capture.segmentIntervalMs, "capture");
        ReadField(*capture, "segment_format", config.capture.segmentFormat, "capture");
    }

    if (const nlohmann::json* dispatch = GetSection(root, "dispatch")) {
        ReadField(*dispatch, "debounce_ms", config.dispatch.debounceMs, "dispatch");
    }

    config.Validate();
    return config;
}

void AppConfig::Validate() const {
    EndpointUrl::Parse(endpoint.url);
    SegmentEncoder::ParseContainer(capture.segmentFormat);

    if (endpoint.timeoutMs == 0) {
        throw ConfigError("endpoint.timeout_ms must be positive");
    }
    if (capture.sampleRate == 0) {
        throw ConfigError("capture.sample_rate must be positive");
    }
    if (capture.channels == 0) {
        throw ConfigError("capture.channels must be positive");
    }
    if (capture.segmentIntervalMs == 0) {
        throw ConfigError("capture.segment_interval_ms must be positive");
    }
}

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLine commandLine;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&args, &i, &arg]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--config") {
            commandLine.configPath = value();
        } else if (arg == "--endpoint") {
            commandLine.endpointUrl = value();
        } else if (arg == "--file") {
            commandLine.inputFile = value();
        } else if (arg == "--help" || arg == "-h") {
            commandLine.showHelp = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return commandLine;
}

} // namespace chunkscribe
