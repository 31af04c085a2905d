#include "roomsync/p2p/signaling_server.h"
#include "roomsync/p2p/framed_connection.h"
#include "roomsync/base/logger.h"
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

namespace roomsync {

namespace {

Bytes to_frame(const nlohmann::json& message) {
    std::string text = message.dump();
    return Bytes(text.begin(), text.end());
}

int64_t steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

struct SignalingServer::Impl : std::enable_shared_from_this<SignalingServer::Impl> {
    struct Client {
        uint64_t id = 0;
        std::shared_ptr<FramedConnection> connection;
        std::set<std::string> topics;
        std::atomic<int64_t> last_seen_ms{0};
    };

    SignalingServerConfig config;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> listener;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};

    mutable std::mutex mutex;
    uint64_t next_client_id = 1;
    std::unordered_map<uint64_t, std::shared_ptr<Client>> clients;
    std::unordered_map<std::string, std::set<uint64_t>> topics;

    elio::coro::task<void> accept_loop() {
        auto self = shared_from_this();
        Logger::instance().info("Signaling server accept loop started");

        while (running.load()) {
            auto stream_result = co_await listener->accept();
            if (!stream_result) {
                if (running.load()) {
                    Logger::instance().error("Accept error: " + std::string(strerror(errno)));
                }
                continue;
            }
            add_client(std::move(*stream_result));
        }

        Logger::instance().info("Signaling server accept loop stopped");
    }

    void add_client(elio::net::tcp_stream stream) {
        auto client = std::make_shared<Client>();
        client->connection = FramedConnection::create(std::move(stream), scheduler);
        client->last_seen_ms = steady_ms();
        {
            std::lock_guard<std::mutex> lock(mutex);
            client->id = next_client_id++;
            clients[client->id] = client;
        }

        std::weak_ptr<Impl> weak = shared_from_this();
        uint64_t id = client->id;
        client->connection->start(
            [weak, id](Bytes frame) {
                if (auto impl = weak.lock()) impl->handle_frame(id, frame);
            },
            [weak, id]() {
                if (auto impl = weak.lock()) impl->remove_client(id);
            });

        Logger::instance().debug("Signaling client " + std::to_string(id) + " connected from " +
                                 client->connection->remote_address());
    }

    void remove_client(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = clients.find(id);
        if (it == clients.end()) return;

        for (const auto& topic : it->second->topics) {
            auto topic_it = topics.find(topic);
            if (topic_it == topics.end()) continue;
            topic_it->second.erase(id);
            if (topic_it->second.empty()) {
                topics.erase(topic_it);
            }
        }
        clients.erase(it);
        Logger::instance().debug("Signaling client " + std::to_string(id) + " disconnected");
    }

    void handle_frame(uint64_t id, const Bytes& frame) {
        std::shared_ptr<Client> client;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = clients.find(id);
            if (it == clients.end()) return;
            client = it->second;
        }
        client->last_seen_ms = steady_ms();

        auto message = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            Logger::instance().warning("Malformed message from signaling client " + std::to_string(id));
            return;
        }

        std::string type = message.value("type", "");
        if (type == "subscribe" || type == "unsubscribe") {
            auto list = message.find("topics");
            if (list == message.end() || !list->is_array()) return;

            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& topic : *list) {
                if (!topic.is_string()) continue;
                const auto& name = topic.get_ref<const std::string&>();
                if (type == "subscribe") {
                    client->topics.insert(name);
                    topics[name].insert(id);
                } else {
                    client->topics.erase(name);
                    auto topic_it = topics.find(name);
                    if (topic_it != topics.end()) {
                        topic_it->second.erase(id);
                        if (topic_it->second.empty()) topics.erase(topic_it);
                    }
                }
            }
        } else if (type == "publish") {
            auto topic = message.find("topic");
            if (topic == message.end() || !topic->is_string()) return;

            std::vector<std::shared_ptr<FramedConnection>> receivers;
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto topic_it = topics.find(topic->get<std::string>());
                if (topic_it == topics.end()) return;
                for (uint64_t subscriber : topic_it->second) {
                    auto client_it = clients.find(subscriber);
                    if (client_it != clients.end()) {
                        receivers.push_back(client_it->second->connection);
                    }
                }
            }

            message["clients"] = receivers.size();
            auto out = to_frame(message);
            for (auto& receiver : receivers) {
                receiver->send(out);
            }
        } else if (type == "ping") {
            client->connection->send(to_frame({{"type", "pong"}}));
        }
    }

    elio::coro::task<void> timeout_loop() {
        auto self = shared_from_this();
        const int64_t timeout_ms = static_cast<int64_t>(config.ping_timeout_sec) * 1000;

        while (running.load()) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(500));

            std::vector<std::shared_ptr<Client>> stale;
            int64_t now = steady_ms();
            {
                std::lock_guard<std::mutex> lock(mutex);
                for (const auto& [id, client] : clients) {
                    if (now - client->last_seen_ms.load() > timeout_ms) {
                        stale.push_back(client);
                    }
                }
            }
            for (auto& client : stale) {
                Logger::instance().info("Closing silent signaling client " + std::to_string(client->id));
                client->connection->close();
            }
        }
    }
};

SignalingServer::SignalingServer(const SignalingServerConfig& config,
                                 std::shared_ptr<elio::runtime::scheduler> scheduler)
    : impl_(std::make_shared<Impl>()) {
    impl_->config = config;
    impl_->scheduler = std::move(scheduler);
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    if (impl_->running.load()) {
        Logger::instance().warning("Signaling server already running");
        return true;
    }

    elio::net::tcp_options opts;
    opts.reuse_addr = true;
    opts.no_delay = true;
    opts.backlog = 128;

    elio::net::ipv4_address addr(impl_->config.bind_address, impl_->config.listen_port);
    auto listener = elio::net::tcp_listener::bind(addr, opts);
    if (!listener) {
        Logger::instance().error("Failed to bind signaling server on " + impl_->config.bind_address + ":" +
                                 std::to_string(impl_->config.listen_port) + ": " + strerror(errno));
        return false;
    }

    impl_->listener = std::move(*listener);
    impl_->bound_port = impl_->listener->local_address().port();
    impl_->running = true;

    spawn_detached(impl_->scheduler, impl_->accept_loop());
    spawn_detached(impl_->scheduler, impl_->timeout_loop());

    Logger::instance().info("Signaling server listening on " + impl_->config.bind_address + ":" +
                            std::to_string(impl_->bound_port));
    return true;
}

void SignalingServer::stop() {
    if (!impl_->running.exchange(false)) return;

    if (impl_->listener) {
        impl_->listener->close();
    }

    std::vector<std::shared_ptr<FramedConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, client] : impl_->clients) {
            connections.push_back(client->connection);
        }
    }
    for (auto& connection : connections) {
        connection->close();
    }
    Logger::instance().info("Signaling server stopped");
}

bool SignalingServer::is_running() const {
    return impl_->running.load();
}

uint16_t SignalingServer::port() const {
    return impl_->bound_port;
}

size_t SignalingServer::client_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->clients.size();
}

size_t SignalingServer::topic_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->topics.size();
}

} // namespace roomsync
