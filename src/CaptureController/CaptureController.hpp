#pragma once

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "../ChunkDispatcher/ChunkDispatcher.hpp"
#include "../Codec/DecoderContext.hpp"
#include "../Codec/SegmentEncoder.hpp"

namespace chunkscribe {

class ICaptureDevice;
class TranscriptionPipeline;

struct CaptureSettings {
    std::chrono::milliseconds segmentInterval{10000};
    std::chrono::milliseconds debounceWindow{500};
    SegmentEncoder::Container container = SegmentEncoder::Container::Wav;
};

// Управляет сессией захвата: Idle -> Capturing -> Stopped.
// Start/Stop/Shutdown are called on the io_context thread; audio buffers
// arrive on the capture thread and are posted to the io_context.
class CaptureController {
public:
    enum class State {
        Idle,
        Capturing,
        Stopped
    };

    using StateCallback = std::function<void(State)>;

    CaptureController(boost::asio::io_context& io,
                      ICaptureDevice& device,
                      TranscriptionPipeline& pipeline,
                      CaptureSettings settings,
                      DecoderContext::Factory decoderFactory);
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    // Throws PermissionError; state stays unchanged in that case.
    // No-op while already capturing.
    void Start();

    // No-op unless capturing. Frames since the last segment boundary are
    // submitted as a final, shorter segment.
    void Stop();

    // Stop capture, release the decoder, cancel the pending dispatch.
    // Every step runs even if an earlier one fails.
    void Shutdown();

    State GetState() const { return _state.load(); }
    void SetStateCallback(StateCallback callback) { _stateCallback = std::move(callback); }

    uint64_t GetEmittedSegments() const { return _emittedSegments.load(); }
    bool HasPendingDispatch() const { return _dispatcher.HasPending(); }
    bool IsDecoderCreated() const { return _decoder.IsCreated(); }

    static const char* GetStateName(State state);

private:
    void OnAudioBuffer(uint64_t session, const int16_t* samples, size_t frames);
    void EmitSegment(uint64_t session, std::vector<int16_t> samples);
    void SubmitSamples(const std::vector<int16_t>& samples);
    void ChangeState(State newState);

    boost::asio::io_context& _io;
    ICaptureDevice& _device;
    TranscriptionPipeline& _pipeline;
    CaptureSettings _settings;

    DecoderContext _decoder;
    ChunkDispatcher _dispatcher;
    std::unique_ptr<SegmentEncoder> _encoder;

    std::atomic<State> _state;
    std::atomic<uint64_t> _session;
    std::atomic<uint64_t> _emittedSegments;
    StateCallback _stateCallback;

    // Накопление кадров в потоке захвата
    std::mutex _bufferMutex;
    std::vector<int16_t> _segmentBuffer;
    size_t _samplesPerSegment;
};

} // namespace chunkscribe
