#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace chunkscribe {

class ICaptureDevice {
public:
    // (interleaved samples, frame count); called from the capture thread
    using BufferCallback = std::function<void(const int16_t*, size_t)>;

    virtual ~ICaptureDevice() = default;

    // Opens and starts the input stream. Throws PermissionError when access
    // is denied or no input device can be opened.
    virtual void Start(BufferCallback onBuffer) = 0;

    // Stops and closes the stream. Safe to call when not running.
    virtual void Stop() = 0;

    virtual bool IsRunning() const = 0;

    // Valid after a successful Start()
    virtual unsigned int GetSampleRate() const = 0;
    virtual unsigned int GetChannels() const = 0;
};

} // namespace chunkscribe
