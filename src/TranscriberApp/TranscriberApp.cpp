#include "TranscriberApp.hpp"

#include "../CaptureController/CaptureController.hpp"
#include "../CaptureController/RtAudioCaptureDevice.hpp"
#include "../Codec/DecoderContext.hpp"
#include "../Codec/SndfileDecoder.hpp"
#include "../TranscriptionClient/EndpointUrl.hpp"
#include "../TranscriptionClient/HttpTranscriptionClient.hpp"
#include "../TranscriptionPipeline/TranscriptionPipeline.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <thread>

namespace chunkscribe {

namespace {

// Runs the io_context on its own thread for the lifetime of the object
class LoopThread {
public:
    explicit LoopThread(boost::asio::io_context& io)
        : _work(boost::asio::make_work_guard(io))
        , _thread([&io]() { io.run(); }) {
    }

    ~LoopThread() {
        _work.reset();
        if (_thread.joinable()) {
            _thread.join();
        }
    }

private:
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
    std::thread _thread;
};

// Выполняет fn в потоке io_context и ждет результат (исключения пробрасываются)
template <typename Fn>
auto RunOnLoop(boost::asio::io_context& io, Fn fn) -> decltype(fn()) {
    std::packaged_task<decltype(fn())()> task(std::move(fn));
    auto future = task.get_future();
    boost::asio::post(io, [&task]() { task(); });
    return future.get();
}

std::unique_ptr<IAudioDecoder> MakeDecoder() {
    return std::make_unique<SndfileDecoder>();
}

std::string GetExtension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    return dot == std::string::npos ? std::string() : path.substr(dot + 1);
}

} // namespace

TranscriberApp::TranscriberApp(AppConfig config)
    : _config(std::move(config))
    , _running(true) {
}

int TranscriberApp::Run(std::istream& input) {
    CaptureDeviceConfig deviceConfig;
    deviceConfig.deviceId = _config.capture.deviceId;
    deviceConfig.sampleRate = _config.capture.sampleRate;
    deviceConfig.channels = _config.capture.channels;

    CaptureSettings settings;
    settings.segmentInterval = std::chrono::milliseconds(_config.capture.segmentIntervalMs);
    settings.debounceWindow = std::chrono::milliseconds(_config.dispatch.debounceMs);
    settings.container = SegmentEncoder::ParseContainer(_config.capture.segmentFormat);

    RtAudioCaptureDevice device(deviceConfig);
    HttpTranscriptionClient client(_io, EndpointUrl::Parse(_config.endpoint.url),
                                   std::chrono::milliseconds(_config.endpoint.timeoutMs));
    TranscriptionPipeline pipeline(client);
    pipeline.SetOnTranscriptChanged(&TranscriberApp::RenderTranscript);

    CaptureController controller(_io, device, pipeline, settings, &MakeDecoder);
    controller.SetStateCallback([](CaptureController::State state) {
        std::cout << "[STATE] " << CaptureController::GetStateName(state) << std::endl;
    });

    // Уничтожается первым: дожидается завершения цикла до разрушения компонентов
    LoopThread loop(_io);

    const bool started = RunOnLoop(_io, [&controller]() {
        try {
            controller.Start();
            return true;
        } catch (const PermissionError& e) {
            std::cerr << "Error accessing microphone: " << e.what() << std::endl;
            std::cout << "Please allow microphone access to start recording." << std::endl;
            return false;
        }
    });

    if (started) {
        std::cout << "Sending audio to " << client.GetEndpoint().ToString() << std::endl;
    }
    PrintHelp();

    std::string command;
    while (_running && input >> command) {
        if (!ProcessCommand(command, controller, pipeline)) {
            break;
        }
    }

    RunOnLoop(_io, [&controller]() { controller.Shutdown(); });

    const size_t inFlight = RunOnLoop(_io, [&pipeline]() { return pipeline.GetInFlight(); });
    if (inFlight > 0) {
        std::cout << "Waiting for " << inFlight << " upload(s) to finish..." << std::endl;
    }
    return started ? 0 : 1;
}

int TranscriberApp::TranscribeFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Could not open input file: " << path << std::endl;
        return 1;
    }

    AudioSegment segment;
    segment.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    segment.container = GetExtension(path);

    HttpTranscriptionClient client(_io, EndpointUrl::Parse(_config.endpoint.url),
                                   std::chrono::milliseconds(_config.endpoint.timeoutMs));
    TranscriptionPipeline pipeline(client);
    DecoderContext decoder(&MakeDecoder);

    bool failed = false;
    pipeline.SetOnChunkFailed([&failed](TranscriptionPipeline::FailureKind, const std::string&) {
        failed = true;
    });

    pipeline.Process(segment, decoder);
    _io.run();
    decoder.Release();

    RenderTranscript(pipeline.GetTranscript());
    return failed ? 1 : 0;
}

bool TranscriberApp::ProcessCommand(const std::string& command,
                                    CaptureController& controller,
                                    TranscriptionPipeline& pipeline) {
    if (command == "start") {
        RunOnLoop(_io, [&controller]() {
            try {
                controller.Start();
            } catch (const PermissionError& e) {
                std::cerr << "Error accessing microphone: " << e.what() << std::endl;
                std::cout << "Please allow microphone access to start recording." << std::endl;
            }
        });
    }
    else if (command == "stop") {
        RunOnLoop(_io, [&controller]() { controller.Stop(); });
    }
    else if (command == "clear") {
        RunOnLoop(_io, [&pipeline]() { pipeline.ClearTranscript(); });
    }
    else if (command == "show") {
        const TranscriptLog log = RunOnLoop(_io, [&pipeline]() { return pipeline.GetTranscript(); });
        RenderTranscript(log);
    }
    else if (command == "quit" || command == "exit") {
        _running = false;
        return false;
    }
    else if (command == "help") {
        PrintHelp();
    }
    else {
        std::cout << "Unknown command: " << command << std::endl;
        PrintHelp();
    }
    return true;
}

void TranscriberApp::PrintHelp() const {
    std::cout << "\n=== Live Transcription ===" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  start   - Start recording again" << std::endl;
    std::cout << "  stop    - Stop recording" << std::endl;
    std::cout << "  clear   - Clear transcriptions" << std::endl;
    std::cout << "  show    - Print transcriptions" << std::endl;
    std::cout << "  help    - Show this help" << std::endl;
    std::cout << "  quit    - Exit application" << std::endl;
    std::cout << "==========================\n" << std::endl;
}

void TranscriberApp::RenderTranscript(const TranscriptLog& log) {
    std::cout << "\nTranscriptions:" << std::endl;
    if (log.Empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const std::string& entry : log.GetEntries()) {
        std::cout << "  " << entry << std::endl;
    }
}

} // namespace chunkscribe
