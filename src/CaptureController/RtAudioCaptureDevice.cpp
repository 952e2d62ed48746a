#include "RtAudioCaptureDevice.hpp"

#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace chunkscribe {

namespace {
constexpr unsigned int kFallbackSampleRate = 48000;
}

int RtAudioCaptureDevice::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                                 double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* device = static_cast<RtAudioCaptureDevice*>(userData);

    if (status) {
        CHUNKSCRIBE_LOG("Stream overflow detected!" << CHUNKSCRIBE_LOG_ENDL);
    }

    if (device->_running && inputBuffer && device->_onBuffer) {
        device->_onBuffer(static_cast<const int16_t*>(inputBuffer), nBufferFrames);
    }
    return 0;
}

RtAudioCaptureDevice::RtAudioCaptureDevice(CaptureDeviceConfig config)
    : _parameters()
    , _config(config)
    , _running(false)
    , _sampleRate(0)
    , _channels(0) {
    _audio.showWarnings(false);
}

RtAudioCaptureDevice::~RtAudioCaptureDevice() {
    Stop();
}

RtAudio::DeviceInfo RtAudioCaptureDevice::SelectDevice() {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw PermissionError("No audio devices found");
    }

    CHUNKSCRIBE_LOG("Available audio devices:" << CHUNKSCRIBE_LOG_ENDL);
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
        CHUNKSCRIBE_LOG("Device " << id << ": " << info.name << " (input channels: "
                        << info.inputChannels << ")" << CHUNKSCRIBE_LOG_ENDL);
    }

    unsigned int deviceId = _config.deviceId ? _config.deviceId : _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(deviceId);

    if (info.inputChannels < 1) {
        CHUNKSCRIBE_LOG("Device " << deviceId << " has no input channels! Searching for alternative..."
                        << CHUNKSCRIBE_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio.getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                deviceId = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        throw PermissionError("No input devices found");
    }

    CHUNKSCRIBE_LOG("Using input device: " << info.name << CHUNKSCRIBE_LOG_ENDL);
    _parameters.deviceId = deviceId;
    return info;
}

unsigned int RtAudioCaptureDevice::SelectSampleRate(const RtAudio::DeviceInfo& info) const {
    const bool supported = std::find(info.sampleRates.begin(), info.sampleRates.end(),
                                     _config.sampleRate) != info.sampleRates.end();
    if (supported || info.preferredSampleRate == 0) {
        return _config.sampleRate;
    }
    CHUNKSCRIBE_LOG(_config.sampleRate << " not supported, using preferred rate: "
                    << info.preferredSampleRate << CHUNKSCRIBE_LOG_ENDL);
    return info.preferredSampleRate;
}

void RtAudioCaptureDevice::Start(BufferCallback onBuffer) {
    std::lock_guard<std::mutex> lock(_streamMutex);
    if (_running) {
        return;
    }

    const RtAudio::DeviceInfo info = SelectDevice();
    _parameters.nChannels = std::max(1u, std::min(_config.channels, info.inputChannels));
    _parameters.firstChannel = 0;

    _onBuffer = std::move(onBuffer);
    unsigned int sampleRate = SelectSampleRate(info);
    unsigned int bufferFrames = _config.bufferFrames;

    CHUNKSCRIBE_LOG("Opening stream: " << sampleRate << " Hz, " << _parameters.nChannels
                    << " ch, " << bufferFrames << " frames, SINT16" << CHUNKSCRIBE_LOG_ENDL);

    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          sampleRate, &bufferFrames, &Record, this)) {
        CHUNKSCRIBE_LOG("Error opening stream: " << _audio.getErrorText() << CHUNKSCRIBE_LOG_ENDL);
        if (sampleRate == kFallbackSampleRate) {
            throw PermissionError("Could not open input stream: " + _audio.getErrorText());
        }
        CHUNKSCRIBE_LOG("Trying sample rate " << kFallbackSampleRate << "..." << CHUNKSCRIBE_LOG_ENDL);
        sampleRate = kFallbackSampleRate;
        if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                              sampleRate, &bufferFrames, &Record, this)) {
            throw PermissionError("Could not open input stream: " + _audio.getErrorText());
        }
    }

    _sampleRate = sampleRate;
    _channels = _parameters.nChannels;
    _running = true;

    if (_audio.startStream()) {
        _running = false;
        const std::string error = _audio.getErrorText();
        CloseStream();
        throw PermissionError("Could not start input stream: " + error);
    }

    CHUNKSCRIBE_LOG("Capture started" << CHUNKSCRIBE_LOG_ENDL);
}

void RtAudioCaptureDevice::Stop() {
    std::lock_guard<std::mutex> lock(_streamMutex);
    _running = false;
    CloseStream();
}

void RtAudioCaptureDevice::CloseStream() {
    if (_audio.isStreamRunning() && _audio.stopStream()) {
        std::cerr << "Error stopping stream: " << _audio.getErrorText() << std::endl;
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

} // namespace chunkscribe
