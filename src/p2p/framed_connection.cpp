#include "roomsync/p2p/framed_connection.h"
#include "roomsync/base/logger.h"
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <arpa/inet.h>
#include <cstring>

namespace roomsync {

elio::coro::task<bool> write_frame(elio::net::tcp_stream& stream, const uint8_t* data, size_t size) {
    if (size > MAX_FRAME_SIZE) {
        Logger::instance().error("Frame too large to send: " + std::to_string(size));
        co_return false;
    }

    uint32_t be_size = htonl(static_cast<uint32_t>(size));
    uint8_t header[4];
    std::memcpy(header, &be_size, 4);

    size_t sent = 0;
    while (sent < sizeof(header)) {
        auto result = co_await stream.write(header + sent, sizeof(header) - sent);
        if (result.result <= 0) co_return false;
        sent += static_cast<size_t>(result.result);
    }

    sent = 0;
    while (sent < size) {
        auto result = co_await stream.write(data + sent, size - sent);
        if (result.result <= 0) co_return false;
        sent += static_cast<size_t>(result.result);
    }
    co_return true;
}

elio::coro::task<std::optional<Bytes>> read_frame(elio::net::tcp_stream& stream) {
    uint8_t header[4];
    size_t total_read = 0;
    while (total_read < sizeof(header)) {
        auto result = co_await stream.read(header + total_read, sizeof(header) - total_read);
        if (result.result <= 0) co_return std::nullopt;
        total_read += static_cast<size_t>(result.result);
    }

    uint32_t msg_size = 0;
    std::memcpy(&msg_size, header, 4);
    msg_size = ntohl(msg_size);

    if (msg_size > MAX_FRAME_SIZE) {
        Logger::instance().warning("Invalid frame size: " + std::to_string(msg_size));
        co_return std::nullopt;
    }

    Bytes frame(msg_size);
    total_read = 0;
    while (total_read < msg_size) {
        auto result = co_await stream.read(frame.data() + total_read, msg_size - total_read);
        if (result.result <= 0) co_return std::nullopt;
        total_read += static_cast<size_t>(result.result);
    }
    co_return frame;
}

elio::coro::task<std::optional<elio::net::tcp_stream>> connect_with_timeout(
    std::shared_ptr<elio::runtime::scheduler> scheduler, std::string host, uint16_t port,
    std::chrono::milliseconds timeout) {
    // The connect runs as its own task so a stalled handshake cannot outlive the timeout
    struct Attempt {
        std::atomic<bool> done{false};
        std::atomic<bool> abandoned{false};
        std::optional<elio::net::tcp_stream> stream;
    };
    auto attempt = std::make_shared<Attempt>();

    auto connect_task = [](std::string host, uint16_t port,
                           std::shared_ptr<Attempt> attempt) -> elio::coro::task<void> {
        elio::net::tcp_options opts;
        opts.no_delay = true;
        auto connect_result = co_await elio::net::tcp_connect(host, port, opts);
        if (connect_result) {
            if (attempt->abandoned) {
                co_await connect_result->close();
            } else {
                attempt->stream.emplace(std::move(*connect_result));
            }
        }
        attempt->done = true;
    };
    spawn_detached(scheduler, connect_task(host, port, attempt));

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!attempt->done && std::chrono::steady_clock::now() < deadline) {
        co_await elio::time::sleep_for(std::chrono::milliseconds(10));
    }

    if (!attempt->done) {
        attempt->abandoned = true;
        Logger::instance().debug("Connect to {}:{} timed out", host, port);
        co_return std::nullopt;
    }
    co_return std::move(attempt->stream);
}

FramedConnection::FramedConnection(elio::net::tcp_stream stream,
                                   std::shared_ptr<elio::runtime::scheduler> scheduler)
    : stream_(std::move(stream)), scheduler_(std::move(scheduler)) {
    auto peer = stream_.peer_address();
    remote_address_ = peer ? peer->to_string() : "unknown";
}

FramedConnection::~FramedConnection() = default;

std::shared_ptr<FramedConnection> FramedConnection::create(
    elio::net::tcp_stream stream, std::shared_ptr<elio::runtime::scheduler> scheduler) {
    return std::shared_ptr<FramedConnection>(new FramedConnection(std::move(stream), std::move(scheduler)));
}

void FramedConnection::start(FrameHandler on_frame, CloseHandler on_close) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_frame_ = std::move(on_frame);
        on_close_ = std::move(on_close);
    }
    spawn_detached(scheduler_, read_loop());
}

void FramedConnection::send(Bytes frame) {
    if (!open_) return;

    bool spawn_writer = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outgoing_.push_back(std::move(frame));
        if (!draining_) {
            draining_ = true;
            spawn_writer = true;
        }
    }
    if (spawn_writer) {
        spawn_detached(scheduler_, drain());
    }
}

void FramedConnection::close() {
    if (!open_.exchange(false)) return;

    // Frames already queued are flushed before the stream is shut down
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (draining_) {
            close_after_drain_ = true;
            return;
        }
    }
    spawn_detached(scheduler_, shutdown_stream());
}

elio::coro::task<void> FramedConnection::read_loop() {
    auto self = shared_from_this();

    while (open_) {
        auto frame = co_await read_frame(stream_);
        if (!frame) break;

        bytes_received_ += frame->size() + 4;
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = on_frame_;
        }
        if (handler) {
            try {
                handler(std::move(*frame));
            } catch (const std::exception& e) {
                Logger::instance().error("Frame handler error from " + remote_address_ + ": " + e.what());
            }
        }
    }

    if (open_.exchange(false)) {
        co_await stream_.close();
    }
    finish();
}

elio::coro::task<void> FramedConnection::drain() {
    auto self = shared_from_this();

    while (true) {
        Bytes frame;
        bool have_frame = false;
        bool shutdown = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outgoing_.empty() || write_failed_) {
                outgoing_.clear();
                draining_ = false;
                shutdown = close_after_drain_;
                close_after_drain_ = false;
            } else {
                frame = std::move(outgoing_.front());
                outgoing_.pop_front();
                have_frame = true;
            }
        }

        if (!have_frame) {
            if (shutdown) {
                co_await shutdown_stream();
            }
            co_return;
        }

        bool ok = co_await write_frame(stream_, frame.data(), frame.size());
        if (!ok) {
            Logger::instance().debug("Write failed to " + remote_address_);
            std::lock_guard<std::mutex> lock(mutex_);
            write_failed_ = true;
            if (open_.exchange(false)) {
                close_after_drain_ = true;
            }
            continue;
        }
        bytes_sent_ += frame.size() + 4;
    }
}

elio::coro::task<void> FramedConnection::shutdown_stream() {
    auto self = shared_from_this();
    co_await stream_.close();
    finish();
}

void FramedConnection::finish() {
    if (finished_.exchange(true)) return;

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = std::move(on_close_);
        on_frame_ = nullptr;
    }
    if (handler) {
        handler();
    }
}

} // namespace roomsync
