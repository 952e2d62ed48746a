#pragma once

#include <cstdint>
#include <vector>

#include "../common/AudioTypes.hpp"

namespace chunkscribe {

class IAudioDecoder;

// Сегмент -> PCM16LE mono 16 kHz. Не хранит состояния, повторный вызов безопасен.
class SampleConverter {
public:
    explicit SampleConverter(IAudioDecoder& decoder);

    // Throws DecodeError or ConversionError
    PcmBuffer Convert(const AudioSegment& segment) const;

    // Downmix to mono and resample to targetRate. Output length is
    // round(frames * targetRate / sampleRate).
    static std::vector<float> Render(const DecodedAudio& decoded, unsigned int targetRate);

    // round(clamp(sample, -1, 1) * 32767)
    static int16_t Quantize(float sample);

    static std::vector<uint8_t> EncodePcm16Le(const std::vector<float>& samples);

private:
    static std::vector<float> Downmix(const DecodedAudio& decoded);
    static std::vector<float> Resample(const std::vector<float>& input,
                                       unsigned int inputRate, unsigned int outputRate);

    IAudioDecoder& _decoder;
};

} // namespace chunkscribe
