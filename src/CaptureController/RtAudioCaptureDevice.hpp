#pragma once

#include <RtAudio.h>

#include <atomic>
#include <mutex>

#include "ICaptureDevice.hpp"

namespace chunkscribe {

struct CaptureDeviceConfig {
    unsigned int deviceId = 0;          // 0: default input device
    unsigned int sampleRate = 44100;    // preferred, falls back to the device's rate
    unsigned int channels = 1;
    unsigned int bufferFrames = 256;
};

// Захват с микрофона через RtAudio, формат SINT16
class RtAudioCaptureDevice : public ICaptureDevice {
public:
    explicit RtAudioCaptureDevice(CaptureDeviceConfig config);
    ~RtAudioCaptureDevice() override;

    RtAudioCaptureDevice(const RtAudioCaptureDevice&) = delete;
    RtAudioCaptureDevice& operator=(const RtAudioCaptureDevice&) = delete;

    void Start(BufferCallback onBuffer) override;
    void Stop() override;
    bool IsRunning() const override { return _running.load(); }

    unsigned int GetSampleRate() const override { return _sampleRate; }
    unsigned int GetChannels() const override { return _channels; }

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    RtAudio::DeviceInfo SelectDevice();
    unsigned int SelectSampleRate(const RtAudio::DeviceInfo& info) const;
    void CloseStream();

    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    CaptureDeviceConfig _config;
    BufferCallback _onBuffer;
    std::atomic<bool> _running;
    unsigned int _sampleRate;
    unsigned int _channels;
    mutable std::mutex _streamMutex;
};

} // namespace chunkscribe
