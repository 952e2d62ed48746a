#include "TranscriptLog.hpp"

#include <algorithm>

namespace chunkscribe {

bool TranscriptLog::Contains(const std::string& text) const {
    return std::find(_entries.begin(), _entries.end(), text) != _entries.end();
}

} // namespace chunkscribe
