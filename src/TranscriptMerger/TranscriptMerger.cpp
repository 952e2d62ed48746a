#include "TranscriptMerger.hpp"

namespace chunkscribe {

const std::string* TranscriptMerger::SelectCandidate(const TranscriptionResult& result,
                                                     const TranscriptLog& log) {
    if (result.empty()) {
        return nullptr;
    }
    const std::string& candidate = result.back();
    if (candidate.empty() || log.Contains(candidate)) {
        return nullptr;
    }
    return &candidate;
}

TranscriptLog TranscriptMerger::Accept(const TranscriptionResult& result, const TranscriptLog& log) {
    TranscriptLog merged = log;
    if (const std::string* candidate = SelectCandidate(result, log)) {
        merged.Append(*candidate);
    }
    return merged;
}

} // namespace chunkscribe
