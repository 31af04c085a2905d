#ifndef ROOMSYNC_P2P_SIGNALING_H
#define ROOMSYNC_P2P_SIGNALING_H

#include "roomsync/p2p/framed_connection.h"
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace roomsync {

// Topic pub/sub client used for rendezvous, presence and relay
class SignalingTransport {
public:
    // (topic, data) of a publish delivered by the server
    using MessageHandler = std::function<void(const std::string& topic, const nlohmann::json& data)>;

    virtual ~SignalingTransport() = default;

    virtual elio::coro::task<bool> open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Non-blocking; messages are queued in order
    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;
    virtual void publish(const std::string& topic, const nlohmann::json& data) = 0;

    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual const std::string& endpoint() const = 0;
};

using SignalingTransportFactory =
    std::function<std::unique_ptr<SignalingTransport>(const std::string& endpoint)>;

// Splits "host:port"; false on a missing or invalid port
bool parse_endpoint(const std::string& endpoint, std::string& host, uint16_t& port);

// Signaling client over TCP with length-prefixed JSON frames.
// Keeps its subscriptions and restores them after a reconnect.
class TcpSignalingClient : public SignalingTransport {
public:
    TcpSignalingClient(std::string endpoint, std::shared_ptr<elio::runtime::scheduler> scheduler,
                       uint32_t connect_timeout_ms = 5000);
    ~TcpSignalingClient() override;

    elio::coro::task<bool> open() override;
    void close() override;
    bool is_open() const override;

    void subscribe(const std::string& topic) override;
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, const nlohmann::json& data) override;

    void set_message_handler(MessageHandler handler) override;
    const std::string& endpoint() const override { return endpoint_; }

    static SignalingTransportFactory factory(std::shared_ptr<elio::runtime::scheduler> scheduler,
                                             uint32_t connect_timeout_ms = 5000);

private:
    struct State;

    static elio::coro::task<bool> connect_once(std::shared_ptr<State> state);
    static elio::coro::task<void> keepalive_loop(std::shared_ptr<State> state, uint64_t generation);
    static elio::coro::task<void> reconnect_loop(std::shared_ptr<State> state);
    static void on_frame(const std::shared_ptr<State>& state, Bytes frame);
    static void send_json(const std::shared_ptr<State>& state, const nlohmann::json& message);

    std::string endpoint_;
    std::shared_ptr<State> state_;
};

} // namespace roomsync

#endif // ROOMSYNC_P2P_SIGNALING_H
