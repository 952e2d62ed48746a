#include "DecoderContext.hpp"

#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <iostream>

namespace chunkscribe {

DecoderContext::DecoderContext(Factory factory)
    : _factory(std::move(factory)) {
}

DecoderContext::~DecoderContext() {
    try {
        Release();
    } catch (const std::exception& e) {
        std::cerr << "Error releasing decoder: " << e.what() << std::endl;
    }
}

IAudioDecoder& DecoderContext::Get() {
    if (!_decoder) {
        if (!_factory) {
            throw ConversionError("No decoder factory configured");
        }
        _decoder = _factory();
        if (!_decoder) {
            throw ConversionError("Decoder factory returned nothing");
        }
        CHUNKSCRIBE_LOG("Decoder context created" << CHUNKSCRIBE_LOG_ENDL);
    }
    return *_decoder;
}

void DecoderContext::Release() {
    // Забираем владение до Close(), чтобы декодер уничтожился даже при исключении
    std::unique_ptr<IAudioDecoder> decoder = std::move(_decoder);
    if (decoder) {
        decoder->Close();
        CHUNKSCRIBE_LOG("Decoder context released" << CHUNKSCRIBE_LOG_ENDL);
    }
}

} // namespace chunkscribe
