#pragma once

#include <string>
#include <vector>

namespace chunkscribe {

struct AppConfig {
    struct Endpoint {
        std::string url = "http://localhost:8000/apz/transcribe";
        unsigned int timeoutMs = 30000;
    } endpoint;

    struct Capture {
        unsigned int deviceId = 0;
        unsigned int sampleRate = 44100;
        unsigned int channels = 1;
        unsigned int segmentIntervalMs = 10000;
        std::string segmentFormat = "wav";
    } capture;

    struct Dispatch {
        unsigned int debounceMs = 500;
    } dispatch;

    // Absent keys keep their defaults. Throws ConfigError.
    static AppConfig Load(const std::string& path);
    static AppConfig Parse(const std::string& text);

    // Checks values that cannot be expressed by JSON types alone
    void Validate() const;
};

struct CommandLine {
    std::string configPath;
    std::string endpointUrl;
    std::string inputFile;
    bool showHelp = false;

    // Throws ConfigError on unknown options
    static CommandLine Parse(const std::vector<std::string>& args);
};

} // namespace chunkscribe
