#pragma once

#include <vector>

#include "IAudioDecoder.hpp"

namespace chunkscribe {

// Decodes any container libsndfile understands (WAV, FLAC, OGG/Vorbis, ...)
class SndfileDecoder : public IAudioDecoder {
public:
    SndfileDecoder();
    ~SndfileDecoder() override;

    DecodedAudio Decode(const uint8_t* data, size_t size) override;
    void Close() override;

private:
    std::vector<float> _block;
};

} // namespace chunkscribe
