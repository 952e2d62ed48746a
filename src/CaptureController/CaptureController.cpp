#include "CaptureController.hpp"

#include "ICaptureDevice.hpp"
#include "../TranscriptionPipeline/TranscriptionPipeline.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <iostream>

namespace chunkscribe {

CaptureController::CaptureController(boost::asio::io_context& io,
                                     ICaptureDevice& device,
                                     TranscriptionPipeline& pipeline,
                                     CaptureSettings settings,
                                     DecoderContext::Factory decoderFactory)
    : _io(io)
    , _device(device)
    , _pipeline(pipeline)
    , _settings(settings)
    , _decoder(std::move(decoderFactory))
    , _dispatcher(io, settings.debounceWindow, [this](AudioSegment segment) {
          _pipeline.Process(segment, _decoder);
      })
    , _state(State::Idle)
    , _session(0)
    , _emittedSegments(0)
    , _samplesPerSegment(0) {
}

CaptureController::~CaptureController() {
    Shutdown();
}

const char* CaptureController::GetStateName(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::Capturing: return "Capturing";
        case State::Stopped: return "Stopped";
    }
    return "Unknown";
}

void CaptureController::Start() {
    if (_state == State::Capturing) {
        CHUNKSCRIBE_LOG("Capture already running" << CHUNKSCRIBE_LOG_ENDL);
        return;
    }

    const uint64_t session = ++_session;
    {
        std::lock_guard<std::mutex> lock(_bufferMutex);
        _segmentBuffer.clear();
        _samplesPerSegment = 0;
    }

    // PermissionError уходит вызывающему, состояние не меняется
    _device.Start([this, session](const int16_t* samples, size_t frames) {
        OnAudioBuffer(session, samples, frames);
    });

    const unsigned int sampleRate = _device.GetSampleRate();
    const unsigned int channels = std::max(1u, _device.GetChannels());
    _encoder = std::make_unique<SegmentEncoder>(_settings.container, sampleRate, channels);

    const size_t framesPerSegment = std::max<size_t>(
        1, static_cast<size_t>(_settings.segmentInterval.count()) * sampleRate / 1000);
    {
        std::lock_guard<std::mutex> lock(_bufferMutex);
        _samplesPerSegment = framesPerSegment * channels;
    }

    CHUNKSCRIBE_LOG("Capture session " << session << ": " << sampleRate << " Hz, " << channels
                    << " ch, segment every " << _settings.segmentInterval.count() << " ms"
                    << CHUNKSCRIBE_LOG_ENDL);
    ChangeState(State::Capturing);
}

void CaptureController::Stop() {
    if (_state != State::Capturing) {
        return;
    }

    // Новый номер сессии отбрасывает сегменты, уже поставленные в очередь
    ++_session;
    ChangeState(State::Stopped);

    std::vector<int16_t> tail;
    {
        std::lock_guard<std::mutex> lock(_bufferMutex);
        tail.swap(_segmentBuffer);
        _samplesPerSegment = 0;
    }

    // Недописанный хвост уходит последним сегментом сессии; Shutdown() его отменяет
    if (!tail.empty()) {
        SubmitSamples(tail);
    }

    _device.Stop();
    std::cout << "Recording stopped" << std::endl;
}

void CaptureController::Shutdown() {
    try {
        Stop();
    } catch (const std::exception& e) {
        std::cerr << "Error stopping capture: " << e.what() << std::endl;
    }

    try {
        _decoder.Release();
    } catch (const std::exception& e) {
        std::cerr << "Error releasing decoder: " << e.what() << std::endl;
    }

    try {
        _dispatcher.Cancel();
    } catch (const std::exception& e) {
        std::cerr << "Error cancelling dispatch: " << e.what() << std::endl;
    }
}

void CaptureController::OnAudioBuffer(uint64_t session, const int16_t* samples, size_t frames) {
    if (!samples || frames == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(_bufferMutex);
    if (session != _session.load()) {
        return;
    }

    const size_t channels = std::max(1u, _device.GetChannels());
    _segmentBuffer.insert(_segmentBuffer.end(), samples, samples + frames * channels);

    // До завершения Start() размер сегмента неизвестен, просто копим
    if (_samplesPerSegment == 0) {
        return;
    }

    while (_segmentBuffer.size() >= _samplesPerSegment) {
        std::vector<int16_t> segment(_segmentBuffer.begin(), _segmentBuffer.begin() + _samplesPerSegment);
        _segmentBuffer.erase(_segmentBuffer.begin(), _segmentBuffer.begin() + _samplesPerSegment);

        boost::asio::post(_io, [this, session, segment = std::move(segment)]() mutable {
            EmitSegment(session, std::move(segment));
        });
    }
}

void CaptureController::EmitSegment(uint64_t session, std::vector<int16_t> samples) {
    if (session != _session.load() || _state != State::Capturing) {
        CHUNKSCRIBE_LOG("Dropping segment from finished session " << session << CHUNKSCRIBE_LOG_ENDL);
        return;
    }
    SubmitSamples(samples);
}

void CaptureController::SubmitSamples(const std::vector<int16_t>& samples) {
    if (samples.empty() || !_encoder) {
        return;
    }

    AudioSegment segment;
    try {
        segment = _encoder->Encode(samples);
    } catch (const EncodeError& e) {
        std::cerr << "Error encoding audio segment: " << e.what() << std::endl;
        return;
    }
    if (segment.Empty()) {
        return;
    }

    ++_emittedSegments;
    _dispatcher.Submit(std::move(segment));
}

void CaptureController::ChangeState(State newState) {
    _state = newState;
    if (_stateCallback) {
        _stateCallback(newState);
    }
}

} // namespace chunkscribe
