#include "ChunkDispatcher.hpp"

#include "../common/debug_log.hpp"

#include <boost/asio/error.hpp>

#include <iostream>

namespace chunkscribe {

ChunkDispatcher::ChunkDispatcher(boost::asio::io_context& io,
                                 std::chrono::milliseconds quietWindow,
                                 Handler handler)
    : _state(std::make_shared<State>(io))
    , _quietWindow(quietWindow) {
    _state->handler = std::move(handler);
}

ChunkDispatcher::~ChunkDispatcher() {
    Cancel();
}

void ChunkDispatcher::Submit(AudioSegment segment) {
    if (_state->pending) {
        CHUNKSCRIBE_LOG("Dispatcher: replacing pending segment" << CHUNKSCRIBE_LOG_ENDL);
    }
    _state->pending = std::move(segment);
    const uint64_t generation = ++_state->generation;

    // expires_after отменяет предыдущее ожидание
    _state->timer.expires_after(_quietWindow);

    std::weak_ptr<State> weakState = _state;
    _state->timer.async_wait([weakState, generation](const boost::system::error_code& ec) {
        OnTimer(weakState, generation, ec);
    });
}

void ChunkDispatcher::Cancel() {
    ++_state->generation;
    _state->pending.reset();
    _state->timer.cancel();
}

void ChunkDispatcher::OnTimer(const std::weak_ptr<State>& weakState, uint64_t generation,
                              const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }

    auto state = weakState.lock();
    if (!state) {
        return;
    }

    // A completion already queued when Submit()/Cancel() ran still arrives
    // with success; the generation check filters it out.
    if (state->generation != generation || !state->pending) {
        return;
    }

    if (ec) {
        std::cerr << "Dispatcher timer error: " << ec.message() << std::endl;
        return;
    }

    AudioSegment segment = std::move(*state->pending);
    state->pending.reset();

    CHUNKSCRIBE_LOG("Dispatcher: quiet window settled, processing " << segment.bytes.size()
                    << " bytes" << CHUNKSCRIBE_LOG_ENDL);
    if (state->handler) {
        state->handler(std::move(segment));
    }
}

} // namespace chunkscribe
