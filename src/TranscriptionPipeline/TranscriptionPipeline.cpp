#include "TranscriptionPipeline.hpp"

#include "../Codec/DecoderContext.hpp"
#include "../SampleConverter/SampleConverter.hpp"
#include "../TranscriptMerger/TranscriptMerger.hpp"
#include "../TranscriptionClient/ITranscriptionClient.hpp"
#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <iostream>

namespace chunkscribe {

TranscriptionPipeline::TranscriptionPipeline(ITranscriptionClient& client)
    : _client(client)
    , _inFlight(0)
    , _processed(0) {
}

const char* TranscriptionPipeline::GetFailureName(FailureKind kind) {
    switch (kind) {
        case FailureKind::Decode: return "decode";
        case FailureKind::Conversion: return "conversion";
        case FailureKind::Network: return "network";
        case FailureKind::Service: return "service";
    }
    return "unknown";
}

void TranscriptionPipeline::Process(const AudioSegment& segment, DecoderContext& decoder) {
    PcmBuffer pcm;
    try {
        SampleConverter converter(decoder.Get());
        pcm = converter.Convert(segment);
    } catch (const DecodeError& e) {
        return ReportFailure(FailureKind::Decode, e.what());
    } catch (const ConversionError& e) {
        return ReportFailure(FailureKind::Conversion, e.what());
    } catch (const std::exception& e) {
        // Например bad_alloc из декодера: сегмент пропускается, сессия продолжается
        return ReportFailure(FailureKind::Decode, e.what());
    }

    ++_inFlight;
    _client.AsyncTranscribe(std::move(pcm), [this](std::exception_ptr error, TranscriptionResult result) {
        OnTranscribed(error, std::move(result));
    });
}

void TranscriptionPipeline::OnTranscribed(std::exception_ptr error, TranscriptionResult result) {
    --_inFlight;
    ++_processed;

    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const ServiceError& e) {
            return ReportFailure(FailureKind::Service, e.what());
        } catch (const NetworkError& e) {
            return ReportFailure(FailureKind::Network, e.what());
        } catch (const std::exception& e) {
            return ReportFailure(FailureKind::Network, e.what());
        }
    }

    // Чтение, проверка и запись лога идут одним обработчиком без прерываний
    TranscriptLog merged = TranscriptMerger::Accept(result, _log);
    if (merged == _log) {
        CHUNKSCRIBE_LOG("No new transcription in response of " << result.size()
                        << " candidates" << CHUNKSCRIBE_LOG_ENDL);
        return;
    }

    _log = std::move(merged);
    CHUNKSCRIBE_LOG("Accepted: " << _log.GetEntries().back() << CHUNKSCRIBE_LOG_ENDL);
    if (_onTranscriptChanged) {
        _onTranscriptChanged(_log);
    }
}

void TranscriptionPipeline::ClearTranscript() {
    if (_log.Empty()) {
        return;
    }
    _log.Clear();
    if (_onTranscriptChanged) {
        _onTranscriptChanged(_log);
    }
}

void TranscriptionPipeline::ReportFailure(FailureKind kind, const std::string& message) {
    if (kind == FailureKind::Service) {
        std::cerr << "Transcription failed: " << message << std::endl;
    } else {
        std::cerr << "Error processing audio chunk (" << GetFailureName(kind) << "): "
                  << message << std::endl;
    }
    if (_onChunkFailed) {
        _onChunkFailed(kind, message);
    }
}

} // namespace chunkscribe
