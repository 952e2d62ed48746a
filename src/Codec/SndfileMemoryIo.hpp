#pragma once

#include <sndfile.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace chunkscribe {

struct SndfileCloser {
    void operator()(SNDFILE* file) const noexcept;
};

using SndfilePtr = std::unique_ptr<SNDFILE, SndfileCloser>;

// In-memory stream for sf_open_virtual. Read mode borrows the caller's bytes,
// write mode grows an owned buffer.
class SndfileMemoryStream {
public:
    SndfileMemoryStream();
    SndfileMemoryStream(const uint8_t* data, size_t size);

    SndfileMemoryStream(const SndfileMemoryStream&) = delete;
    SndfileMemoryStream& operator=(const SndfileMemoryStream&) = delete;

    SndfilePtr Open(int mode, SF_INFO* info);

    std::vector<uint8_t> TakeBytes();

private:
    static sf_count_t GetLength(void* userData);
    static sf_count_t Seek(sf_count_t offset, int whence, void* userData);
    static sf_count_t Read(void* ptr, sf_count_t count, void* userData);
    static sf_count_t Write(const void* ptr, sf_count_t count, void* userData);
    static sf_count_t Tell(void* userData);

    const uint8_t* Data() const { return _writable ? _buffer.data() : _readData; }
    sf_count_t Size() const;

    std::vector<uint8_t> _buffer;
    const uint8_t* _readData;
    size_t _readSize;
    sf_count_t _position;
    bool _writable;
};

} // namespace chunkscribe
