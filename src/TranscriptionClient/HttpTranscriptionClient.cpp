#include "HttpTranscriptionClient.hpp"

#include "../common/Errors.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <memory>

namespace chunkscribe {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr const char* kPcmContentType = "audio/pcm";
constexpr const char* kUserAgent = "chunkscribe";
}

// Один запрос: resolve -> connect -> write -> read. Держит себя через shared_ptr,
// пока выполняются асинхронные операции.
class HttpTranscriptionClient::Request : public std::enable_shared_from_this<Request> {
public:
    Request(asio::io_context& io, const EndpointUrl& endpoint,
            std::chrono::milliseconds timeout, Callback callback)
        : _resolver(io)
        , _stream(io)
        , _endpoint(endpoint)
        , _timeout(timeout)
        , _callback(std::move(callback)) {
    }

    void Run(const PcmBuffer& pcm) {
        _request.method(http::verb::post);
        _request.target(_endpoint.target);
        _request.version(11);
        _request.set(http::field::host, _endpoint.host);
        _request.set(http::field::user_agent, kUserAgent);
        _request.set(http::field::content_type, kPcmContentType);
        _request.body().assign(reinterpret_cast<const char*>(pcm.bytes.data()), pcm.bytes.size());
        _request.prepare_payload();

        _resolver.async_resolve(_endpoint.host, _endpoint.port,
            [self = shared_from_this()](const beast::error_code& ec, tcp::resolver::results_type results) {
                self->OnResolve(ec, std::move(results));
            });
    }

private:
    void OnResolve(const beast::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            return Fail("resolve", ec);
        }
        _stream.expires_after(_timeout);
        _stream.async_connect(results,
            [self = shared_from_this()](const beast::error_code& ec, const tcp::endpoint&) {
                self->OnConnect(ec);
            });
    }

    void OnConnect(const beast::error_code& ec) {
        if (ec) {
            return Fail("connect", ec);
        }
        _stream.expires_after(_timeout);
        http::async_write(_stream, _request,
            [self = shared_from_this()](const beast::error_code& ec, std::size_t) {
                self->OnWrite(ec);
            });
    }

    void OnWrite(const beast::error_code& ec) {
        if (ec) {
            return Fail("write", ec);
        }
        http::async_read(_stream, _buffer, _response,
            [self = shared_from_this()](const beast::error_code& ec, std::size_t) {
                self->OnRead(ec);
            });
    }

    void OnRead(const beast::error_code& ec) {
        if (ec) {
            return Fail("read", ec);
        }

        beast::error_code shutdownEc;
        _stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);
        if (shutdownEc && shutdownEc != beast::errc::not_connected) {
            CHUNKSCRIBE_LOG("Socket shutdown: " << shutdownEc.message() << CHUNKSCRIBE_LOG_ENDL);
        }

        TranscriptionResult result;
        try {
            result = ParseResponse(_response.result_int(), std::string(_response.reason()), _response.body());
        } catch (const ServiceError&) {
            return Complete(std::current_exception(), {});
        }
        Complete(nullptr, std::move(result));
    }

    void Fail(const char* stage, const beast::error_code& ec) {
        Complete(std::make_exception_ptr(NetworkError(std::string(stage) + ": " + ec.message())), {});
    }

    void Complete(std::exception_ptr error, TranscriptionResult result) {
        if (!_callback) {
            return;
        }
        Callback callback = std::move(_callback);
        _callback = nullptr;
        callback(error, std::move(result));
    }

    tcp::resolver _resolver;
    beast::tcp_stream _stream;
    beast::flat_buffer _buffer;
    http::request<http::string_body> _request;
    http::response<http::string_body> _response;
    EndpointUrl _endpoint;
    std::chrono::milliseconds _timeout;
    Callback _callback;
};

HttpTranscriptionClient::HttpTranscriptionClient(asio::io_context& io,
                                                 EndpointUrl endpoint,
                                                 std::chrono::milliseconds timeout)
    : _io(io)
    , _endpoint(std::move(endpoint))
    , _timeout(timeout) {
}

void HttpTranscriptionClient::AsyncTranscribe(PcmBuffer pcm, Callback callback) {
    CHUNKSCRIBE_LOG("Uploading " << pcm.bytes.size() << " bytes to " << _endpoint.ToString()
                    << CHUNKSCRIBE_LOG_ENDL);
    auto request = std::make_shared<Request>(_io, _endpoint, _timeout, std::move(callback));
    request->Run(pcm);
}

TranscriptionResult HttpTranscriptionClient::ParseResponse(unsigned int status,
                                                           const std::string& reason,
                                                           const std::string& body) {
    if (status < 200 || status >= 300) {
        throw ServiceError(status, reason.empty() ? "request failed" : reason);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ServiceError(status, std::string("malformed response body: ") + e.what());
    }

    if (!json.is_object() || !json.contains("transcriptions") || !json["transcriptions"].is_array()) {
        throw ServiceError(status, "response has no transcriptions list");
    }

    try {
        return json["transcriptions"].get<TranscriptionResult>();
    } catch (const nlohmann::json::type_error& e) {
        throw ServiceError(status, std::string("transcriptions must be strings: ") + e.what());
    }
}

} // namespace chunkscribe
