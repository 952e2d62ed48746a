#pragma once

#include "CaptureController/ICaptureDevice.hpp"
#include "Codec/SegmentEncoder.hpp"
#include "Codec/SndfileDecoder.hpp"
#include "TranscriptionClient/ITranscriptionClient.hpp"
#include "common/AudioTypes.hpp"
#include "common/Errors.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

using namespace std::chrono_literals;

// Крутит io_context, пока не выполнится условие или не истечет время
inline bool RunUntil(boost::asio::io_context& io, const std::function<bool()>& done,
                     std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        if (io.stopped()) {
            io.restart();
        }
        if (io.run_for(10ms) == 0) {
            std::this_thread::sleep_for(1ms);
        }
    }
    return done();
}

inline void RunFor(boost::asio::io_context& io, std::chrono::milliseconds duration) {
    RunUntil(io, []() { return false; }, duration);
}

inline std::vector<int16_t> ToSamples(const std::vector<uint8_t>& bytes) {
    std::vector<int16_t> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
    }
    return samples;
}

inline chunkscribe::AudioSegment MakeWavSegment(const std::vector<int16_t>& samples,
                                                unsigned int sampleRate, unsigned int channels = 1) {
    chunkscribe::SegmentEncoder encoder(chunkscribe::SegmentEncoder::Container::Wav, sampleRate, channels);
    return encoder.Encode(samples);
}

// Simulates the microphone: the test pushes buffers as the capture thread would
class FakeCaptureDevice : public chunkscribe::ICaptureDevice {
public:
    explicit FakeCaptureDevice(unsigned int sampleRate = 16000, unsigned int channels = 1)
        : _sampleRate(sampleRate), _channels(channels) {}

    void Start(BufferCallback onBuffer) override {
        ++startCalls;
        if (denyAccess) {
            throw chunkscribe::PermissionError("Microphone access denied");
        }
        _onBuffer = std::move(onBuffer);
        _running = true;
    }

    void Stop() override {
        ++stopCalls;
        _running = false;
        _onBuffer = nullptr;
        if (failOnStop) {
            throw std::runtime_error("device failed to stop");
        }
    }

    bool IsRunning() const override { return _running; }
    unsigned int GetSampleRate() const override { return _sampleRate; }
    unsigned int GetChannels() const override { return _channels; }

    void Feed(const std::vector<int16_t>& samples) {
        if (_running && _onBuffer) {
            _onBuffer(samples.data(), samples.size() / _channels);
        }
    }

    bool denyAccess = false;
    bool failOnStop = false;
    int startCalls = 0;
    int stopCalls = 0;

private:
    unsigned int _sampleRate;
    unsigned int _channels;
    bool _running = false;
    BufferCallback _onBuffer;
};

struct DecoderStats {
    int created = 0;
    int decodes = 0;
    int closes = 0;
    bool failOnClose = false;
};

class CountingDecoder : public chunkscribe::SndfileDecoder {
public:
    explicit CountingDecoder(std::shared_ptr<DecoderStats> stats) : _stats(std::move(stats)) {
        ++_stats->created;
    }

    chunkscribe::DecodedAudio Decode(const uint8_t* data, size_t size) override {
        ++_stats->decodes;
        return SndfileDecoder::Decode(data, size);
    }

    void Close() override {
        ++_stats->closes;
        SndfileDecoder::Close();
        if (_stats->failOnClose) {
            throw std::runtime_error("decoder failed to close");
        }
    }

private:
    std::shared_ptr<DecoderStats> _stats;
};

// Answers from a queue on the next io_context turn, or holds the callbacks
// so a test can complete them in any order
class FakeTranscriptionClient : public chunkscribe::ITranscriptionClient {
public:
    struct Response {
        chunkscribe::TranscriptionResult result;
        std::exception_ptr error;
    };

    explicit FakeTranscriptionClient(boost::asio::io_context& io) : _io(io) {}

    void AsyncTranscribe(chunkscribe::PcmBuffer pcm, Callback callback) override {
        requests.push_back(std::move(pcm));
        if (holdResponses) {
            held.push_back(std::move(callback));
            return;
        }

        Response response;
        if (!responses.empty()) {
            response = responses.front();
            responses.pop_front();
        }
        boost::asio::post(_io, [callback, response]() {
            callback(response.error, response.result);
        });
    }

    std::deque<Response> responses;
    std::vector<chunkscribe::PcmBuffer> requests;
    bool holdResponses = false;
    std::vector<Callback> held;

private:
    boost::asio::io_context& _io;
};

// Минимальный HTTP сервер на 127.0.0.1 в отдельном потоке
class LoopbackHttpServer {
public:
    struct Reply {
        unsigned int status = 200;  // 0: close the connection without answering
        std::string body;
    };

    struct ReceivedRequest {
        std::string method;
        std::string target;
        std::string contentType;
        std::string body;
    };

    explicit LoopbackHttpServer(std::vector<Reply> replies)
        : _acceptor(_io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
        , _replies(std::move(replies))
        , _stopping(false) {
        _port = _acceptor.local_endpoint().port();
        _thread = std::thread([this]() { Serve(); });
    }

    ~LoopbackHttpServer() {
        _stopping = true;
        // Разблокируем accept() пустым подключением
        boost::system::error_code ec;
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket socket(io);
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), _port}, ec);
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    unsigned short GetPort() const { return _port; }

    std::string GetUrl(const std::string& target = "/apz/transcribe") const {
        return "http://127.0.0.1:" + std::to_string(_port) + target;
    }

    std::vector<ReceivedRequest> GetRequests() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _requests;
    }

private:
    void Serve() {
        namespace http = boost::beast::http;
        size_t served = 0;

        while (!_stopping) {
            boost::asio::ip::tcp::socket socket(_io);
            boost::system::error_code ec;
            _acceptor.accept(socket, ec);
            if (_stopping || ec) {
                break;
            }

            boost::beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request, ec);
            if (ec) {
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(_mutex);
                _requests.push_back({std::string(request.method_string()),
                                     std::string(request.target()),
                                     std::string(request[http::field::content_type]),
                                     request.body()});
            }

            const Reply reply = _replies.empty()
                ? Reply{}
                : _replies[std::min(served, _replies.size() - 1)];
            ++served;

            if (reply.status == 0) {
                socket.close(ec);
                continue;
            }

            http::response<http::string_body> response{static_cast<http::status>(reply.status), request.version()};
            response.set(http::field::content_type, "application/json");
            response.keep_alive(false);
            response.body() = reply.body;
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        }
    }

    boost::asio::io_context _io;
    boost::asio::ip::tcp::acceptor _acceptor;
    unsigned short _port;
    std::vector<Reply> _replies;
    std::atomic<bool> _stopping;
    mutable std::mutex _mutex;
    std::vector<ReceivedRequest> _requests;
    std::thread _thread;
};

// Порт, на котором гарантированно никто не слушает
inline unsigned short GetClosedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    const unsigned short port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace test_utils
