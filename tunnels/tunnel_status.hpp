#ifndef TUNNEL_STATUS_HPP
#define TUNNEL_STATUS_HPP

#include <atomic>
#include <cstdint>

// Runtime status shared between a TunnelClient and its proxy sessions.
struct TunnelStatus
{
    std::atomic<bool> connected{false};
    std::atomic<int64_t> active_proxies{0};
    std::atomic<int64_t> last_heartbeat_ns{0}; // system_clock since epoch, 0 = none yet
};

#endif
