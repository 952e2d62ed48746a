#include "Config/AppConfig.hpp"
#include "TranscriberApp/TranscriberApp.hpp"
#include "common/Errors.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--endpoint <url>] [--file <audio file>]" << std::endl;
    std::cout << "Example: " << program << " --endpoint http://localhost:8000/apz/transcribe" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace chunkscribe;

    CommandLine commandLine;
    AppConfig config;
    try {
        commandLine = CommandLine::Parse(std::vector<std::string>(argv + 1, argv + argc));
        if (commandLine.showHelp) {
            PrintUsage(argv[0]);
            return 0;
        }
        if (!commandLine.configPath.empty()) {
            config = AppConfig::Load(commandLine.configPath);
        }
        if (!commandLine.endpointUrl.empty()) {
            config.endpoint.url = commandLine.endpointUrl;
        }
        config.Validate();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        TranscriberApp app(config);
        if (!commandLine.inputFile.empty()) {
            return app.TranscribeFile(commandLine.inputFile);
        }
        return app.Run(std::cin);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
