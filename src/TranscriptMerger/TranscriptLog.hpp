#pragma once

#include <string>
#include <vector>

namespace chunkscribe {

// Принятые распознавания в порядке принятия, без повторов
class TranscriptLog {
public:
    TranscriptLog() = default;

    const std::vector<std::string>& GetEntries() const { return _entries; }
    size_t Size() const { return _entries.size(); }
    bool Empty() const { return _entries.empty(); }

    bool Contains(const std::string& text) const;

    // Explicit user action
    void Clear() { _entries.clear(); }

    bool operator==(const TranscriptLog& other) const { return _entries == other._entries; }
    bool operator!=(const TranscriptLog& other) const { return !(*this == other); }

private:
    friend class TranscriptMerger;

    void Append(std::string text) { _entries.push_back(std::move(text)); }

    std::vector<std::string> _entries;
};

} // namespace chunkscribe
