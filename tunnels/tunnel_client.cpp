#include "tunnel_client.hpp"
#include <atomic>
#include <thread>
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "proxy_session.hpp"

TunnelClient::TunnelClient(const ClientConfig &config)
    : config(config), status(std::make_shared<TunnelStatus>())
{
    conn = std::make_unique<FramedConnection>(
        std::make_unique<Connection>(config.to, config.control_port, NETWORK_TIMEOUT_MS));

    try
    {
        if (!config.secret.empty())
            auth = std::make_shared<Authenticator>(config.secret);
        handshake();
    }
    catch (const std::exception &)
    {
        if (!conn->close())
            log_warn("shutting down the control connection failed");
        throw;
    }

    status->connected = true;
}

TunnelClient::~TunnelClient()
{
    close();
}

void TunnelClient::handshake()
{
    if (auth)
        auth->client_handshake(*conn);

    conn->send(encode_client_message(ClientMessage::hello(config.desired_port)));

    ServerMessage message;
    if (!receive_server_message(*conn, message, true))
    {
        throw TunnelError(ErrorCode::UnexpectedEOF, "unexpected EOF from server");
    }

    switch (message.kind)
    {
    case ServerMessageKind::Hello:
        assigned_port = message.port;
        log_info("connected to server, remote port " + std::to_string(assigned_port));
        return;
    case ServerMessageKind::Error:
        throw TunnelError(ErrorCode::ServerRejected, "server error: " + message.error_text);
    case ServerMessageKind::Challenge:
        if (!auth)
        {
            throw TunnelError(ErrorCode::AuthenticationRequired,
                              "server requires authentication but no secret was provided");
        }
        break;
    case ServerMessageKind::Heartbeat:
    case ServerMessageKind::Connection:
        break;
    }

    throw TunnelError(ErrorCode::UnexpectedInitialMessage,
                      std::string("unexpected initial message: ") + server_message_kind_name(message.kind));
}

bool TunnelClient::last_heartbeat(std::chrono::system_clock::time_point &at) const
{
    int64_t ns = status->last_heartbeat_ns;
    if (ns == 0)
        return false;
    at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
    return true;
}

void TunnelClient::close()
{
    std::call_once(close_once, [this]
                   {
                       status->connected = false;
                       if (!conn->close())
                           log_warn("shutting down the control connection failed");
                   });
}

void TunnelClient::listen(StopSignal &stop)
{
    std::atomic<bool> finished{false};
    std::thread watcher([this, &stop, &finished]
                        {
                            if (stop.wait_until_released(finished))
                                close();
                        });

    // Runs on every exit path: releases the watcher and marks the tunnel down.
    struct ListenCleanup
    {
        TunnelClient &client;
        StopSignal &stop;
        std::atomic<bool> &finished;
        std::thread &watcher;

        ~ListenCleanup()
        {
            finished = true;
            stop.wake();
            watcher.join();
            client.close();
            client.status->connected = false;
        }
    } cleanup{*this, stop, finished, watcher};

    try
    {
        for (;;)
        {
            ServerMessage message;
            if (!receive_server_message(*conn, message, false))
            {
                log_info("control connection closed");
                return;
            }

            switch (message.kind)
            {
            case ServerMessageKind::Heartbeat:
                status->last_heartbeat_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                                std::chrono::system_clock::now().time_since_epoch())
                                                .count();
                log_debug("heartbeat");
                break;
            case ServerMessageKind::Connection:
                log_info("new connection " + message.id.to_string());
                dispatch(message.id);
                break;
            case ServerMessageKind::Hello:
            case ServerMessageKind::Challenge:
                log_warn(std::string("unexpected control message: ") + server_message_kind_name(message.kind));
                break;
            case ServerMessageKind::Error:
                throw TunnelError(ErrorCode::ServerError, "server error: " + message.error_text);
            }
        }
    }
    catch (const TunnelError &e)
    {
        // Closing the socket under a blocked read may surface as an error.
        if (e.code() != ErrorCode::ServerError && stop.stop_requested())
        {
            log_debug(std::string("listen stopped: ") + e.what());
            return;
        }
        throw;
    }
}

void TunnelClient::dispatch(const Uuid &id)
{
    auto session = std::make_shared<ProxySession>(config, auth, status, id);
    std::thread([session]
                {
                    std::string name = session->session_id().to_string();
                    try
                    {
                        session->run();
                        log_debug("proxy " + name + " finished");
                    }
                    catch (const std::exception &e)
                    {
                        log_warn("proxy " + name + " ended with error: " + e.what());
                    }
                })
        .detach();
}
