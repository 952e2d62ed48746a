#pragma once

#include <exception>
#include <functional>

#include "../common/AudioTypes.hpp"

namespace chunkscribe {

class ITranscriptionClient {
public:
    // error is set (NetworkError or ServiceError) when result is unusable
    using Callback = std::function<void(std::exception_ptr error, TranscriptionResult result)>;

    virtual ~ITranscriptionClient() = default;

    // One outbound request per call. The callback runs on the io_context thread.
    virtual void AsyncTranscribe(PcmBuffer pcm, Callback callback) = 0;
};

} // namespace chunkscribe
