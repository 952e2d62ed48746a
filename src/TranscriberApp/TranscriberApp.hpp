#pragma once

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <iosfwd>
#include <string>

#include "../Config/AppConfig.hpp"

namespace chunkscribe {

class CaptureController;
class TranscriptionPipeline;
class TranscriptLog;

// Консольный интерфейс: запускает захват сразу, показывает список распознаваний,
// команды start / stop / clear / show / quit
class TranscriberApp {
public:
    explicit TranscriberApp(AppConfig config);

    // Live capture until "quit" or end of input
    int Run(std::istream& input);

    // One-shot: convert and upload a single audio file
    int TranscribeFile(const std::string& path);

private:
    bool ProcessCommand(const std::string& command,
                        CaptureController& controller,
                        TranscriptionPipeline& pipeline);
    void PrintHelp() const;
    static void RenderTranscript(const TranscriptLog& log);

    AppConfig _config;
    boost::asio::io_context _io;
    std::atomic<bool> _running;
};

} // namespace chunkscribe
