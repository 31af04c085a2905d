#include "roomsync/p2p/signaling.h"
#include "roomsync/base/logger.h"
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <algorithm>
#include <chrono>

namespace roomsync {

namespace {

constexpr auto KEEPALIVE_INTERVAL = std::chrono::seconds(10);
constexpr uint32_t MAX_RECONNECT_DELAY_MS = 30000;

Bytes to_frame(const nlohmann::json& message) {
    std::string text = message.dump();
    return Bytes(text.begin(), text.end());
}

} // anonymous namespace

bool parse_endpoint(const std::string& endpoint, std::string& host, uint16_t& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= endpoint.size()) {
        return false;
    }

    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(endpoint.substr(colon + 1), &consumed);
        if (consumed != endpoint.size() - colon - 1 || value == 0 || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        return false;
    }

    host = endpoint.substr(0, colon);
    return true;
}

struct TcpSignalingClient::State {
    std::string endpoint;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    uint32_t connect_timeout_ms;

    std::mutex mutex;
    std::shared_ptr<FramedConnection> connection;
    std::set<std::string> topics;
    MessageHandler handler;
    uint64_t generation = 0;

    std::atomic<bool> closed{false};
    std::atomic<bool> reconnecting{false};
};

TcpSignalingClient::TcpSignalingClient(std::string endpoint,
                                       std::shared_ptr<elio::runtime::scheduler> scheduler,
                                       uint32_t connect_timeout_ms)
    : endpoint_(std::move(endpoint)), state_(std::make_shared<State>()) {
    state_->endpoint = endpoint_;
    state_->scheduler = std::move(scheduler);
    state_->connect_timeout_ms = connect_timeout_ms;
}

TcpSignalingClient::~TcpSignalingClient() {
    close();
}

SignalingTransportFactory TcpSignalingClient::factory(std::shared_ptr<elio::runtime::scheduler> scheduler,
                                                      uint32_t connect_timeout_ms) {
    return [scheduler, connect_timeout_ms](const std::string& endpoint) -> std::unique_ptr<SignalingTransport> {
        return std::make_unique<TcpSignalingClient>(endpoint, scheduler, connect_timeout_ms);
    };
}

elio::coro::task<bool> TcpSignalingClient::open() {
    state_->closed = false;
    co_return co_await connect_once(state_);
}

elio::coro::task<bool> TcpSignalingClient::connect_once(std::shared_ptr<State> state) {
    std::string host;
    uint16_t port = 0;
    if (!parse_endpoint(state->endpoint, host, port)) {
        Logger::instance().error("Invalid signaling endpoint: " + state->endpoint);
        co_return false;
    }

    auto stream = co_await connect_with_timeout(state->scheduler, host, port,
                                                std::chrono::milliseconds(state->connect_timeout_ms));
    if (!stream) {
        Logger::instance().warning("Failed to connect to signaling server " + state->endpoint);
        co_return false;
    }

    auto connection = FramedConnection::create(std::move(*stream), state->scheduler);
    std::weak_ptr<State> weak = state;

    uint64_t generation = 0;
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->closed) {
            connection->close();
            co_return false;
        }
        state->connection = connection;
        generation = ++state->generation;
        topics.assign(state->topics.begin(), state->topics.end());
    }

    connection->start(
        [weak](Bytes frame) {
            if (auto s = weak.lock()) on_frame(s, std::move(frame));
        },
        [weak, generation]() {
            auto s = weak.lock();
            if (!s) return;
            {
                std::lock_guard<std::mutex> lock(s->mutex);
                if (s->generation != generation) return;
                s->connection.reset();
            }
            if (!s->closed && !s->reconnecting.exchange(true)) {
                Logger::instance().warning("Lost signaling connection to " + s->endpoint + ", reconnecting");
                spawn_detached(s->scheduler, reconnect_loop(s));
            }
        });

    if (!topics.empty()) {
        send_json(state, {{"type", "subscribe"}, {"topics", topics}});
    }
    spawn_detached(state->scheduler, keepalive_loop(state, generation));

    Logger::instance().info("Connected to signaling server " + state->endpoint);
    co_return true;
}

elio::coro::task<void> TcpSignalingClient::keepalive_loop(std::shared_ptr<State> state, uint64_t generation) {
    auto next_ping = std::chrono::steady_clock::now() + KEEPALIVE_INTERVAL;
    while (true) {
        co_await elio::time::sleep_for(std::chrono::milliseconds(200));
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed || state->generation != generation || !state->connection) {
                co_return;
            }
        }
        if (std::chrono::steady_clock::now() >= next_ping) {
            send_json(state, {{"type", "ping"}});
            next_ping = std::chrono::steady_clock::now() + KEEPALIVE_INTERVAL;
        }
    }
}

elio::coro::task<void> TcpSignalingClient::reconnect_loop(std::shared_ptr<State> state) {
    uint32_t delay_ms = 1000;
    while (!state->closed) {
        co_await elio::time::sleep_for(std::chrono::milliseconds(delay_ms));
        if (state->closed) break;

        if (co_await connect_once(state)) {
            Logger::instance().info("Reconnected to signaling server " + state->endpoint);
            break;
        }
        delay_ms = std::min(delay_ms * 2, MAX_RECONNECT_DELAY_MS);
    }
    state->reconnecting = false;
}

void TcpSignalingClient::on_frame(const std::shared_ptr<State>& state, Bytes frame) {
    auto message = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        Logger::instance().warning("Ignoring malformed signaling message from " + state->endpoint);
        return;
    }

    std::string type = message.value("type", "");
    if (type == "pong") {
        return;
    }
    if (type == "ping") {
        send_json(state, {{"type", "pong"}});
        return;
    }
    if (type != "publish") {
        Logger::instance().debug("Ignoring signaling message of type '" + type + "'");
        return;
    }

    auto topic = message.find("topic");
    auto data = message.find("data");
    if (topic == message.end() || !topic->is_string() || data == message.end()) {
        return;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        handler = state->handler;
    }
    if (handler) {
        handler(topic->get<std::string>(), *data);
    }
}

void TcpSignalingClient::send_json(const std::shared_ptr<State>& state, const nlohmann::json& message) {
    std::shared_ptr<FramedConnection> connection;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        connection = state->connection;
    }
    if (connection) {
        connection->send(to_frame(message));
    }
}

void TcpSignalingClient::close() {
    if (state_->closed.exchange(true)) return;

    std::shared_ptr<FramedConnection> connection;
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        connection = std::move(state_->connection);
        topics.assign(state_->topics.begin(), state_->topics.end());
        state_->topics.clear();
        state_->handler = nullptr;
    }
    if (connection) {
        if (!topics.empty()) {
            connection->send(to_frame({{"type", "unsubscribe"}, {"topics", topics}}));
        }
        connection->close();
    }
}

bool TcpSignalingClient::is_open() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->connection && state_->connection->is_open();
}

void TcpSignalingClient::subscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->topics.insert(topic).second) return;
    }
    send_json(state_, {{"type", "subscribe"}, {"topics", nlohmann::json::array({topic})}});
}

void TcpSignalingClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->topics.erase(topic) == 0) return;
    }
    send_json(state_, {{"type", "unsubscribe"}, {"topics", nlohmann::json::array({topic})}});
}

void TcpSignalingClient::publish(const std::string& topic, const nlohmann::json& data) {
    send_json(state_, {{"type", "publish"}, {"topic", topic}, {"data", data}});
}

void TcpSignalingClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->handler = std::move(handler);
}

} // namespace roomsync
