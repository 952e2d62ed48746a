#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "../common/AudioTypes.hpp"

namespace chunkscribe {

// Trailing-edge debounce: a burst of Submit() calls inside the quiet window
// collapses into one handler call with the most recent segment.
// Must be used from the thread running the io_context.
class ChunkDispatcher {
public:
    using Handler = std::function<void(AudioSegment)>;

    ChunkDispatcher(boost::asio::io_context& io,
                    std::chrono::milliseconds quietWindow,
                    Handler handler);
    ~ChunkDispatcher();

    ChunkDispatcher(const ChunkDispatcher&) = delete;
    ChunkDispatcher& operator=(const ChunkDispatcher&) = delete;

    void Submit(AudioSegment segment);

    // Drops the pending segment; nothing fires until the next Submit()
    void Cancel();

    bool HasPending() const { return _state->pending.has_value(); }
    std::chrono::milliseconds GetQuietWindow() const { return _quietWindow; }

private:
    // Таймер и отложенный сегмент живут отдельно, чтобы обработчик таймера
    // мог безопасно сработать после уничтожения диспетчера
    struct State {
        explicit State(boost::asio::io_context& io) : timer(io) {}

        boost::asio::steady_timer timer;
        std::optional<AudioSegment> pending;
        uint64_t generation = 0;
        Handler handler;
    };

    static void OnTimer(const std::weak_ptr<State>& weakState, uint64_t generation,
                        const boost::system::error_code& ec);

    std::shared_ptr<State> _state;
    std::chrono::milliseconds _quietWindow;
};

} // namespace chunkscribe
