#include "SndfileDecoder.hpp"

#include "SndfileMemoryIo.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <string>

namespace chunkscribe {

namespace {
constexpr sf_count_t kBlockFrames = 4096;
}

SndfileDecoder::SndfileDecoder() = default;

SndfileDecoder::~SndfileDecoder() = default;

DecodedAudio SndfileDecoder::Decode(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        throw DecodeError("Empty audio segment");
    }

    SndfileMemoryStream stream(data, size);
    SF_INFO sfinfo{};
    SndfilePtr file = stream.Open(SFM_READ, &sfinfo);
    if (!file) {
        throw DecodeError(std::string("Could not decode segment: ") + sf_strerror(nullptr));
    }
    if (sfinfo.channels <= 0) {
        throw DecodeError("Segment reports no channels");
    }

    DecodedAudio decoded;
    decoded.sampleRate = sfinfo.samplerate > 0 ? static_cast<unsigned int>(sfinfo.samplerate) : 0;
    decoded.channels = static_cast<unsigned int>(sfinfo.channels);
    // Заголовок может врать о длине: резервируем не больше, чем размер входа
    if (sfinfo.frames > 0 && sfinfo.frames != SF_COUNT_MAX) {
        const size_t declared = static_cast<size_t>(sfinfo.frames);
        const size_t plausible = size / decoded.channels;
        decoded.samples.reserve(std::min(declared, plausible) * decoded.channels);
    }

    _block.resize(static_cast<size_t>(kBlockFrames) * decoded.channels);

    // Количество кадров в заголовке может отсутствовать, читаем до конца потока
    sf_count_t framesRead = 0;
    while ((framesRead = sf_readf_float(file.get(), _block.data(), kBlockFrames)) > 0) {
        decoded.samples.insert(decoded.samples.end(), _block.begin(),
                               _block.begin() + framesRead * decoded.channels);
    }

    if (sf_error(file.get()) != SF_ERR_NO_ERROR) {
        throw DecodeError(std::string("Error while decoding segment: ") + sf_strerror(file.get()));
    }

    CHUNKSCRIBE_LOG("Decoded " << decoded.GetFrameCount() << " frames, " << decoded.channels
                    << " ch @ " << decoded.sampleRate << " Hz" << CHUNKSCRIBE_LOG_ENDL);
    return decoded;
}

void SndfileDecoder::Close() {
    _block.clear();
    _block.shrink_to_fit();
}

} // namespace chunkscribe
