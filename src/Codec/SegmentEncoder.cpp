#include "SegmentEncoder.hpp"

#include "SndfileMemoryIo.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

namespace chunkscribe {

SegmentEncoder::Container SegmentEncoder::ParseContainer(const std::string& name) {
    if (name == "wav") return Container::Wav;
    if (name == "flac") return Container::Flac;
    if (name == "ogg") return Container::Ogg;
    throw ConfigError("Unknown segment format: " + name);
}

const char* SegmentEncoder::GetContainerName(Container container) {
    switch (container) {
        case Container::Wav: return "wav";
        case Container::Flac: return "flac";
        case Container::Ogg: return "ogg";
    }
    return "unknown";
}

SegmentEncoder::SegmentEncoder(Container container, unsigned int sampleRate, unsigned int channels)
    : _container(container)
    , _sampleRate(sampleRate)
    , _channels(channels) {
}

int SegmentEncoder::GetFormat() const {
    switch (_container) {
        case Container::Wav: return SF_FORMAT_WAV | SF_FORMAT_PCM_16;
        case Container::Flac: return SF_FORMAT_FLAC | SF_FORMAT_PCM_16;
        case Container::Ogg: return SF_FORMAT_OGG | SF_FORMAT_VORBIS;
    }
    return 0;
}

AudioSegment SegmentEncoder::Encode(const std::vector<int16_t>& samples) const {
    if (_channels == 0 || _sampleRate == 0) {
        throw EncodeError("Sample rate and channel count must be specified");
    }
    if (samples.size() % _channels != 0) {
        throw EncodeError("Sample count is not a multiple of the channel count");
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(_sampleRate);
    sfinfo.channels = static_cast<int>(_channels);
    sfinfo.format = GetFormat();

    if (!sf_format_check(&sfinfo)) {
        throw EncodeError(std::string("libsndfile cannot write ") + GetContainerName(_container) +
                          " at " + std::to_string(_sampleRate) + " Hz");
    }

    SndfileMemoryStream stream;
    SndfilePtr file = stream.Open(SFM_WRITE, &sfinfo);
    if (!file) {
        throw EncodeError(std::string("Could not open encoder: ") + sf_strerror(nullptr));
    }

    const sf_count_t frames = static_cast<sf_count_t>(samples.size() / _channels);
    const sf_count_t framesWritten = sf_writef_short(file.get(), samples.data(), frames);
    if (framesWritten != frames) {
        throw EncodeError("Wrote " + std::to_string(framesWritten) + " frames, expected " +
                          std::to_string(frames) + ": " + sf_strerror(file.get()));
    }

    // sf_close дописывает заголовок контейнера
    const int closeResult = sf_close(file.release());
    if (closeResult != 0) {
        throw EncodeError(std::string("Could not finalize segment: ") + sf_error_number(closeResult));
    }

    AudioSegment segment;
    segment.bytes = stream.TakeBytes();
    segment.container = GetContainerName(_container);

    CHUNKSCRIBE_LOG("Encoded " << frames << " frames into " << segment.bytes.size()
                    << " bytes of " << segment.container << CHUNKSCRIBE_LOG_ENDL);
    return segment;
}

} // namespace chunkscribe
