#ifndef PROXY_SESSION_HPP
#define PROXY_SESSION_HPP

#include <memory>
#include "config.hpp"
#include "uuid.hpp"
#include "tunnel_status.hpp"
#include "crypto/authenticator.hpp"

// Serves one relay-announced connection: opens a tunnel socket to the relay,
// claims the connection with Accept and pipes it to the local service.
class ProxySession
{
private:
    ClientConfig config;
    std::shared_ptr<const Authenticator> auth;
    std::shared_ptr<TunnelStatus> status;
    Uuid id;

public:
    ProxySession(const ClientConfig &config, std::shared_ptr<const Authenticator> auth,
                 std::shared_ptr<TunnelStatus> status, const Uuid &id);

    // Runs until either side closes. Throws on failure.
    void run();

    const Uuid &session_id() const { return id; }
};

#endif
