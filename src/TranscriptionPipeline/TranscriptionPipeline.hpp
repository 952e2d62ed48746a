#pragma once

#include <exception>
#include <functional>
#include <string>

#include "../TranscriptMerger/TranscriptLog.hpp"
#include "../common/AudioTypes.hpp"

namespace chunkscribe {

class DecoderContext;
class ITranscriptionClient;

// Конвертация -> отправка -> слияние для одного сегмента.
// Все методы и колбэки выполняются в потоке io_context, поэтому слияние
// результатов не пересекается во времени. Must outlive the io_context run.
class TranscriptionPipeline {
public:
    enum class FailureKind {
        Decode,
        Conversion,
        Network,
        Service
    };

    using TranscriptCallback = std::function<void(const TranscriptLog&)>;
    using FailureCallback = std::function<void(FailureKind, const std::string&)>;

    explicit TranscriptionPipeline(ITranscriptionClient& client);

    // Per-chunk failures are logged and reported, never thrown
    void Process(const AudioSegment& segment, DecoderContext& decoder);

    void ClearTranscript();
    const TranscriptLog& GetTranscript() const { return _log; }

    size_t GetInFlight() const { return _inFlight; }
    size_t GetProcessedCount() const { return _processed; }

    void SetOnTranscriptChanged(TranscriptCallback callback) { _onTranscriptChanged = std::move(callback); }
    void SetOnChunkFailed(FailureCallback callback) { _onChunkFailed = std::move(callback); }

    static const char* GetFailureName(FailureKind kind);

private:
    void OnTranscribed(std::exception_ptr error, TranscriptionResult result);
    void ReportFailure(FailureKind kind, const std::string& message);

    ITranscriptionClient& _client;
    TranscriptLog _log;
    size_t _inFlight;
    size_t _processed;
    TranscriptCallback _onTranscriptChanged;
    FailureCallback _onChunkFailed;
};

} // namespace chunkscribe
