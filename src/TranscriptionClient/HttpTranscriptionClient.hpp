#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <string>

#include "EndpointUrl.hpp"
#include "ITranscriptionClient.hpp"

namespace chunkscribe {

// POST raw PCM to the transcription endpoint and parse
// {"transcriptions": [...]} from the answer.
class HttpTranscriptionClient : public ITranscriptionClient {
public:
    HttpTranscriptionClient(boost::asio::io_context& io,
                            EndpointUrl endpoint,
                            std::chrono::milliseconds timeout);

    void AsyncTranscribe(PcmBuffer pcm, Callback callback) override;

    const EndpointUrl& GetEndpoint() const { return _endpoint; }

    // Throws ServiceError for non-2xx statuses and unusable bodies
    static TranscriptionResult ParseResponse(unsigned int status,
                                             const std::string& reason,
                                             const std::string& body);

private:
    class Request;

    boost::asio::io_context& _io;
    EndpointUrl _endpoint;
    std::chrono::milliseconds _timeout;
};

} // namespace chunkscribe
