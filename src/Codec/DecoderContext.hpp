#pragma once

#include <functional>
#include <memory>

#include "IAudioDecoder.hpp"

namespace chunkscribe {

// Декодер создается при первой конвертации и переиспользуется до Release()
class DecoderContext {
public:
    using Factory = std::function<std::unique_ptr<IAudioDecoder>()>;

    explicit DecoderContext(Factory factory);
    ~DecoderContext();

    DecoderContext(const DecoderContext&) = delete;
    DecoderContext& operator=(const DecoderContext&) = delete;

    IAudioDecoder& Get();

    // Closes and destroys the decoder. No-op when nothing was created.
    void Release();

    bool IsCreated() const { return _decoder != nullptr; }

private:
    Factory _factory;
    std::unique_ptr<IAudioDecoder> _decoder;
};

} // namespace chunkscribe
