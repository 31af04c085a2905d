#ifndef ROOMSYNC_P2P_FRAMED_CONNECTION_H
#define ROOMSYNC_P2P_FRAMED_CONNECTION_H

#include "roomsync/base/encoding.h"
#include <elio/elio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace roomsync {

constexpr uint32_t MAX_FRAME_SIZE = 32 * 1024 * 1024;

// Hands a task to the scheduler's workers
inline void spawn_detached(const std::shared_ptr<elio::runtime::scheduler>& scheduler,
                           elio::coro::task<void> task) {
    scheduler->spawn(task.release());
}

// Length-prefixed frames: u32 big-endian size, then payload
elio::coro::task<bool> write_frame(elio::net::tcp_stream& stream, const uint8_t* data, size_t size);
elio::coro::task<std::optional<Bytes>> read_frame(elio::net::tcp_stream& stream);

// TCP connect that gives up after timeout; a late connection is closed
elio::coro::task<std::optional<elio::net::tcp_stream>> connect_with_timeout(
    std::shared_ptr<elio::runtime::scheduler> scheduler, std::string host, uint16_t port,
    std::chrono::milliseconds timeout);

// TCP stream carrying frames. Sends are queued and written in order by a
// single writer task; one read loop delivers incoming frames.
class FramedConnection : public std::enable_shared_from_this<FramedConnection> {
public:
    using FrameHandler = std::function<void(Bytes frame)>;
    using CloseHandler = std::function<void()>;

    static std::shared_ptr<FramedConnection> create(elio::net::tcp_stream stream,
                                                    std::shared_ptr<elio::runtime::scheduler> scheduler);
    ~FramedConnection();

    // Starts the read loop; on_close runs once when the connection ends
    void start(FrameHandler on_frame, CloseHandler on_close);

    void send(Bytes frame);
    void close();
    bool is_open() const { return open_.load(); }

    const std::string& remote_address() const { return remote_address_; }
    uint64_t bytes_sent() const { return bytes_sent_.load(); }
    uint64_t bytes_received() const { return bytes_received_.load(); }

private:
    FramedConnection(elio::net::tcp_stream stream, std::shared_ptr<elio::runtime::scheduler> scheduler);

    elio::coro::task<void> read_loop();
    elio::coro::task<void> drain();
    elio::coro::task<void> shutdown_stream();
    void finish();

    elio::net::tcp_stream stream_;
    std::shared_ptr<elio::runtime::scheduler> scheduler_;
    std::string remote_address_;

    std::atomic<bool> open_{true};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_received_{0};

    std::mutex mutex_;
    std::deque<Bytes> outgoing_;
    bool draining_ = false;
    bool close_after_drain_ = false;
    bool write_failed_ = false;
    FrameHandler on_frame_;
    CloseHandler on_close_;
};

} // namespace roomsync

#endif // ROOMSYNC_P2P_FRAMED_CONNECTION_H
