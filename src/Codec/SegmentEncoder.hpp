#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../common/AudioTypes.hpp"

namespace chunkscribe {

// Упаковывает захваченные int16 сэмплы в контейнер через libsndfile
class SegmentEncoder {
public:
    enum class Container {
        Wav,
        Flac,
        Ogg
    };

    // Throws ConfigError for unknown names
    static Container ParseContainer(const std::string& name);
    static const char* GetContainerName(Container container);

    SegmentEncoder(Container container, unsigned int sampleRate, unsigned int channels);

    // samples are interleaved; throws EncodeError
    AudioSegment Encode(const std::vector<int16_t>& samples) const;

    Container GetContainer() const { return _container; }
    unsigned int GetSampleRate() const { return _sampleRate; }
    unsigned int GetChannels() const { return _channels; }

private:
    int GetFormat() const;

    Container _container;
    unsigned int _sampleRate;
    unsigned int _channels;
};

} // namespace chunkscribe
