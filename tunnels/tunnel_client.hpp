#ifndef TUNNEL_CLIENT_HPP
#define TUNNEL_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include "config.hpp"
#include "framed_connection.hpp"
#include "stop_signal.hpp"
#include "tunnel_status.hpp"
#include "uuid.hpp"
#include "crypto/authenticator.hpp"

// Client side of the control channel.
//
// The constructor dials the relay, authenticates when a secret is set and
// exchanges Hello; it throws if any of that fails. listen() then serves
// connection announcements until the relay goes away or the stop signal
// fires. Status accessors may be called from any thread.
class TunnelClient
{
private:
    ClientConfig config;
    std::unique_ptr<FramedConnection> conn;
    std::shared_ptr<const Authenticator> auth;
    std::shared_ptr<TunnelStatus> status;
    uint16_t assigned_port = 0;
    std::once_flag close_once;

    void handshake();
    void dispatch(const Uuid &id);

public:
    explicit TunnelClient(const ClientConfig &config);
    ~TunnelClient();

    TunnelClient(const TunnelClient &) = delete;
    TunnelClient &operator=(const TunnelClient &) = delete;

    uint16_t remote_port() const { return assigned_port; }
    bool connected() const { return status->connected; }
    int64_t active_proxy_count() const { return status->active_proxies; }

    // Returns false until the first heartbeat has been seen.
    bool last_heartbeat(std::chrono::system_clock::time_point &at) const;

    // Closes the control connection. Safe to call repeatedly and concurrently.
    void close();

    // Blocks until the relay closes the control connection (returns
    // normally), the relay reports an error or the connection fails (throws),
    // or stop is requested (returns normally).
    void listen(StopSignal &stop);
};

#endif
