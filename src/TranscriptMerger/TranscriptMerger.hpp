#pragma once

#include "TranscriptLog.hpp"
#include "../common/AudioTypes.hpp"

namespace chunkscribe {

// Only the last (most complete) candidate of a result is considered, and it
// is dropped if the same text was accepted before. A phrase spoken twice in
// the session is therefore recorded once.
class TranscriptMerger {
public:
    static TranscriptLog Accept(const TranscriptionResult& result, const TranscriptLog& log);

    // The candidate Accept() would append, or nullptr
    static const std::string* SelectCandidate(const TranscriptionResult& result,
                                              const TranscriptLog& log);
};

} // namespace chunkscribe
