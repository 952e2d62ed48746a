#include "SampleConverter.hpp"

#include "../Codec/IAudioDecoder.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace chunkscribe {

SampleConverter::SampleConverter(IAudioDecoder& decoder)
    : _decoder(decoder) {
}

PcmBuffer SampleConverter::Convert(const AudioSegment& segment) const {
    const DecodedAudio decoded = _decoder.Decode(segment.bytes.data(), segment.bytes.size());
    const std::vector<float> rendered = Render(decoded, kTargetSampleRate);

    PcmBuffer pcm;
    pcm.bytes = EncodePcm16Le(rendered);

    CHUNKSCRIBE_LOG("Converted " << decoded.GetFrameCount() << " frames @ " << decoded.sampleRate
                    << " Hz into " << pcm.GetSampleCount() << " samples @ " << kTargetSampleRate
                    << " Hz" << CHUNKSCRIBE_LOG_ENDL);
    return pcm;
}

std::vector<float> SampleConverter::Render(const DecodedAudio& decoded, unsigned int targetRate) {
    if (decoded.sampleRate == 0 || targetRate == 0) {
        throw ConversionError("Invalid sample rate: " + std::to_string(decoded.sampleRate) +
                              " -> " + std::to_string(targetRate));
    }
    if (decoded.channels == 0) {
        throw ConversionError("Decoded audio has no channels");
    }
    if (decoded.samples.size() % decoded.channels != 0) {
        throw ConversionError("Decoded audio ends with a partial frame");
    }

    return Resample(Downmix(decoded), decoded.sampleRate, targetRate);
}

std::vector<float> SampleConverter::Downmix(const DecodedAudio& decoded) {
    const size_t frames = decoded.GetFrameCount();
    std::vector<float> mono(frames);

    for (size_t frame = 0; frame < frames; ++frame) {
        const float* src = decoded.samples.data() + frame * decoded.channels;
        float sum = 0.0f;
        for (unsigned int ch = 0; ch < decoded.channels; ++ch) {
            if (!std::isfinite(src[ch])) {
                throw ConversionError("Non-finite sample at frame " + std::to_string(frame));
            }
            sum += src[ch];
        }
        mono[frame] = sum / static_cast<float>(decoded.channels);
    }
    return mono;
}

std::vector<float> SampleConverter::Resample(const std::vector<float>& input,
                                             unsigned int inputRate, unsigned int outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    const size_t inputSamples = input.size();
    const size_t outputSamples = static_cast<size_t>(std::llround(inputSamples * ratio));
    std::vector<float> output(outputSamples);

    // Линейная интерполяция между соседними входными сэмплами
    for (size_t i = 0; i < outputSamples; ++i) {
        const double srcIndex = i / ratio;
        const size_t srcIndex0 = static_cast<size_t>(srcIndex);
        const size_t srcIndex1 = std::min(srcIndex0 + 1, inputSamples - 1);
        const double t = srcIndex - srcIndex0;

        if (srcIndex0 < inputSamples) {
            output[i] = static_cast<float>(input[srcIndex0] * (1.0 - t) + input[srcIndex1] * t);
        } else {
            output[i] = input[inputSamples - 1];
        }
    }

    return output;
}

int16_t SampleConverter::Quantize(float sample) {
    // Clamp first: scaling an out-of-range float would wrap around int16
    const float clamped = std::max(-1.0f, std::min(1.0f, sample));
    return static_cast<int16_t>(std::lround(clamped * 32767.0f));
}

std::vector<uint8_t> SampleConverter::EncodePcm16Le(const std::vector<float>& samples) {
    std::vector<uint8_t> bytes(samples.size() * sizeof(int16_t));
    for (size_t i = 0; i < samples.size(); ++i) {
        const uint16_t value = static_cast<uint16_t>(Quantize(samples[i]));
        bytes[2 * i] = static_cast<uint8_t>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(value >> 8);
    }
    return bytes;
}

} // namespace chunkscribe
