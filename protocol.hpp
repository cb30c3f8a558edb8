#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "uuid.hpp"

class FramedConnection;

// Messages sent by the relay over the control or tunnel socket.
enum class ServerMessageKind
{
    Hello,
    Challenge,
    Heartbeat,
    Connection,
    Error
};

struct ServerMessage
{
    ServerMessageKind kind = ServerMessageKind::Heartbeat;
    uint16_t port = 0;      // Hello
    Uuid id;                // Challenge, Connection
    std::string error_text; // Error

    static ServerMessage hello(uint16_t port);
    static ServerMessage challenge(const Uuid &id);
    static ServerMessage heartbeat();
    static ServerMessage connection(const Uuid &id);
    static ServerMessage error(const std::string &text);
};

// Messages sent by this client.
enum class ClientMessageKind
{
    Hello,
    Authenticate,
    Accept
};

struct ClientMessage
{
    ClientMessageKind kind = ClientMessageKind::Hello;
    uint16_t port = 0; // Hello
    std::string tag;   // Authenticate
    Uuid id;           // Accept

    static ClientMessage hello(uint16_t desired_port);
    static ClientMessage authenticate(const std::string &tag);
    static ClientMessage accept(const Uuid &id);
};

const char *server_message_kind_name(ServerMessageKind kind);

// Decodes one frame payload. Throws TunnelError with UnexpectedUnitMessage,
// MalformedMessage or InvalidUUID.
ServerMessage decode_server_message(const std::string &data);

// Single-key object keyed by the message tag.
nlohmann::json encode_client_message(const ClientMessage &message);

// Receives and decodes the next frame. Returns false on clean end of stream.
bool receive_server_message(FramedConnection &conn, ServerMessage &message, bool apply_timeout);

#endif
