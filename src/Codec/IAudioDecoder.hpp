#pragma once

#include <cstddef>
#include <cstdint>

#include "../common/AudioTypes.hpp"

namespace chunkscribe {

class IAudioDecoder {
public:
    virtual ~IAudioDecoder() = default;

    // Throws DecodeError when the bytes are not a readable container
    virtual DecodedAudio Decode(const uint8_t* data, size_t size) = 0;

    // Releases whatever the decoder holds between calls
    virtual void Close() {}
};

} // namespace chunkscribe
