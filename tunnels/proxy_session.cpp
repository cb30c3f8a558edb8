#include "proxy_session.hpp"
#include <vector>
#include "errors.hpp"
#include "framed_connection.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "relay.hpp"

namespace
{

struct ActiveProxyGuard
{
    TunnelStatus &status;

    explicit ActiveProxyGuard(TunnelStatus &status) : status(status) { status.active_proxies++; }
    ~ActiveProxyGuard() { status.active_proxies--; }
};

} // namespace

ProxySession::ProxySession(const ClientConfig &config, std::shared_ptr<const Authenticator> auth,
                           std::shared_ptr<TunnelStatus> status, const Uuid &id)
    : config(config), auth(std::move(auth)), status(std::move(status)), id(id)
{
}

void ProxySession::run()
{
    ActiveProxyGuard guard(*status);

    FramedConnection remote(std::make_unique<Connection>(config.to, config.control_port, NETWORK_TIMEOUT_MS));

    if (auth)
        auth->client_handshake(remote);

    remote.send(encode_client_message(ClientMessage::accept(id)));

    // From here on the tunnel socket is a raw pipe.
    remote.connection().clear_deadlines();
    std::vector<uint8_t> buffered = remote.drain_buffered();

    std::unique_ptr<Connection> local;
    try
    {
        local = std::make_unique<Connection>(config.local_host, config.local_port, NETWORK_TIMEOUT_MS);
    }
    catch (const TunnelError &e)
    {
        throw TunnelError(e.code(), std::string("connect to local service: ") + e.what());
    }

    if (!buffered.empty())
    {
        log_debug("proxy " + id.to_string() + ": replaying " + std::to_string(buffered.size()) +
                  " buffered bytes");
        local->send_all(buffered.data(), buffered.size());
    }

    relay_bidirectional(*local, remote.connection());
}
