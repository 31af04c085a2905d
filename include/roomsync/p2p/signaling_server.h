#ifndef ROOMSYNC_P2P_SIGNALING_SERVER_H
#define ROOMSYNC_P2P_SIGNALING_SERVER_H

#include "roomsync/base/config.h"
#include <elio/elio.hpp>
#include <memory>
#include <string>

namespace roomsync {

// Topic pub/sub rendezvous server. Publishes fan out to every subscriber
// of the topic (sender included) with the subscriber count added.
class SignalingServer {
public:
    SignalingServer(const SignalingServerConfig& config,
                    std::shared_ptr<elio::runtime::scheduler> scheduler);
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    // Binds and starts accepting; false when the bind fails
    bool start();
    void stop();
    bool is_running() const;

    // Actual port once started (useful when configured with port 0)
    uint16_t port() const;

    size_t client_count() const;
    size_t topic_count() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace roomsync

#endif // ROOMSYNC_P2P_SIGNALING_SERVER_H
