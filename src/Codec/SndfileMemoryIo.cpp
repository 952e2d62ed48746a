#include "SndfileMemoryIo.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace chunkscribe {

void SndfileCloser::operator()(SNDFILE* file) const noexcept {
    if (file) {
        sf_close(file);
    }
}

SndfileMemoryStream::SndfileMemoryStream()
    : _readData(nullptr)
    , _readSize(0)
    , _position(0)
    , _writable(true) {
}

SndfileMemoryStream::SndfileMemoryStream(const uint8_t* data, size_t size)
    : _readData(data)
    , _readSize(size)
    , _position(0)
    , _writable(false) {
}

SndfilePtr SndfileMemoryStream::Open(int mode, SF_INFO* info) {
    static SF_VIRTUAL_IO virtualIo = {
        &SndfileMemoryStream::GetLength,
        &SndfileMemoryStream::Seek,
        &SndfileMemoryStream::Read,
        &SndfileMemoryStream::Write,
        &SndfileMemoryStream::Tell
    };
    _position = 0;
    return SndfilePtr(sf_open_virtual(&virtualIo, mode, info, this));
}

std::vector<uint8_t> SndfileMemoryStream::TakeBytes() {
    _position = 0;
    return std::move(_buffer);
}

sf_count_t SndfileMemoryStream::Size() const {
    return static_cast<sf_count_t>(_writable ? _buffer.size() : _readSize);
}

sf_count_t SndfileMemoryStream::GetLength(void* userData) {
    return static_cast<SndfileMemoryStream*>(userData)->Size();
}

sf_count_t SndfileMemoryStream::Seek(sf_count_t offset, int whence, void* userData) {
    auto* stream = static_cast<SndfileMemoryStream*>(userData);

    sf_count_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = stream->_position + offset; break;
        case SEEK_END: target = stream->Size() + offset; break;
        default: return -1;
    }

    // Writers may seek past the end before writing, readers may not
    if (target < 0 || (!stream->_writable && target > stream->Size())) {
        return -1;
    }
    stream->_position = target;
    return stream->_position;
}

sf_count_t SndfileMemoryStream::Read(void* ptr, sf_count_t count, void* userData) {
    auto* stream = static_cast<SndfileMemoryStream*>(userData);

    const sf_count_t available = std::max<sf_count_t>(0, stream->Size() - stream->_position);
    const sf_count_t toRead = std::min(count, available);
    if (toRead > 0) {
        std::memcpy(ptr, stream->Data() + stream->_position, static_cast<size_t>(toRead));
        stream->_position += toRead;
    }
    return toRead;
}

sf_count_t SndfileMemoryStream::Write(const void* ptr, sf_count_t count, void* userData) {
    auto* stream = static_cast<SndfileMemoryStream*>(userData);
    if (!stream->_writable || count <= 0) {
        return 0;
    }

    const size_t end = static_cast<size_t>(stream->_position + count);
    if (end > stream->_buffer.size()) {
        stream->_buffer.resize(end);
    }
    std::memcpy(stream->_buffer.data() + stream->_position, ptr, static_cast<size_t>(count));
    stream->_position += count;
    return count;
}

sf_count_t SndfileMemoryStream::Tell(void* userData) {
    return static_cast<SndfileMemoryStream*>(userData)->_position;
}

} // namespace chunkscribe
