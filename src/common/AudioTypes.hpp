#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkscribe {

// Все сегменты приводятся к 16 кГц моно перед отправкой
constexpr unsigned int kTargetSampleRate = 16000;
constexpr unsigned int kTargetChannels = 1;

// Закодированный фрагмент записи (WAV/FLAC/OGG контейнер)
struct AudioSegment {
    std::vector<uint8_t> bytes;
    std::string container;

    bool Empty() const { return bytes.empty(); }
};

// PCM16LE, mono, 16 kHz
struct PcmBuffer {
    std::vector<uint8_t> bytes;

    size_t GetSampleCount() const { return bytes.size() / sizeof(int16_t); }
};

// Interleaved float samples at the stream's native format
struct DecodedAudio {
    std::vector<float> samples;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;

    size_t GetFrameCount() const { return channels ? samples.size() / channels : 0; }
};

// Candidates ordered from partial to most complete
using TranscriptionResult = std::vector<std::string>;

} // namespace chunkscribe
