#include "protocol.hpp"
#include <limits>
#include "errors.hpp"
#include "framed_connection.hpp"

using json = nlohmann::json;

ServerMessage ServerMessage::hello(uint16_t port)
{
    ServerMessage message;
    message.kind = ServerMessageKind::Hello;
    message.port = port;
    return message;
}

ServerMessage ServerMessage::challenge(const Uuid &id)
{
    ServerMessage message;
    message.kind = ServerMessageKind::Challenge;
    message.id = id;
    return message;
}

ServerMessage ServerMessage::heartbeat()
{
    return ServerMessage();
}

ServerMessage ServerMessage::connection(const Uuid &id)
{
    ServerMessage message;
    message.kind = ServerMessageKind::Connection;
    message.id = id;
    return message;
}

ServerMessage ServerMessage::error(const std::string &text)
{
    ServerMessage message;
    message.kind = ServerMessageKind::Error;
    message.error_text = text;
    return message;
}

ClientMessage ClientMessage::hello(uint16_t desired_port)
{
    ClientMessage message;
    message.kind = ClientMessageKind::Hello;
    message.port = desired_port;
    return message;
}

ClientMessage ClientMessage::authenticate(const std::string &tag)
{
    ClientMessage message;
    message.kind = ClientMessageKind::Authenticate;
    message.tag = tag;
    return message;
}

ClientMessage ClientMessage::accept(const Uuid &id)
{
    ClientMessage message;
    message.kind = ClientMessageKind::Accept;
    message.id = id;
    return message;
}

const char *server_message_kind_name(ServerMessageKind kind)
{
    switch (kind)
    {
    case ServerMessageKind::Hello:
        return "Hello";
    case ServerMessageKind::Challenge:
        return "Challenge";
    case ServerMessageKind::Heartbeat:
        return "Heartbeat";
    case ServerMessageKind::Connection:
        return "Connection";
    case ServerMessageKind::Error:
        return "Error";
    }
    return "Unknown";
}

namespace
{

Uuid decode_uuid(const std::string &tag, const json &value)
{
    if (!value.is_string())
    {
        throw TunnelError(ErrorCode::MalformedMessage, "invalid " + tag + " message: expected a string");
    }

    Uuid id;
    if (!Uuid::parse(value.get<std::string>(), id))
    {
        throw TunnelError(ErrorCode::InvalidUUID, "invalid " + tag + " uuid: " + value.get<std::string>());
    }
    return id;
}

uint16_t decode_port(const json &value)
{
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > std::numeric_limits<uint16_t>::max())
    {
        throw TunnelError(ErrorCode::MalformedMessage, "invalid Hello message: " + value.dump());
    }
    return static_cast<uint16_t>(value.get<int64_t>());
}

} // namespace

ServerMessage decode_server_message(const std::string &data)
{
    json parsed = json::parse(data, nullptr, false);
    if (parsed.is_discarded())
    {
        throw TunnelError(ErrorCode::MalformedMessage, "invalid server message: " + data);
    }

    if (parsed.is_string())
    {
        std::string unit = parsed.get<std::string>();
        if (unit == "Heartbeat")
            return ServerMessage::heartbeat();
        throw TunnelError(ErrorCode::UnexpectedUnitMessage, "unexpected unit message: " + unit);
    }

    if (!parsed.is_object())
    {
        throw TunnelError(ErrorCode::MalformedMessage, "invalid server message: " + data);
    }
    if (parsed.size() != 1)
    {
        throw TunnelError(ErrorCode::MalformedMessage,
                          "expected single-field message, got " + std::to_string(parsed.size()) + " keys");
    }

    auto field = parsed.begin();
    const std::string &tag = field.key();
    const json &value = field.value();

    if (tag == "Hello")
        return ServerMessage::hello(decode_port(value));
    if (tag == "Challenge")
        return ServerMessage::challenge(decode_uuid(tag, value));
    if (tag == "Connection")
        return ServerMessage::connection(decode_uuid(tag, value));
    if (tag == "Error")
    {
        if (!value.is_string())
            throw TunnelError(ErrorCode::MalformedMessage, "invalid Error message: " + value.dump());
        return ServerMessage::error(value.get<std::string>());
    }

    throw TunnelError(ErrorCode::MalformedMessage, "unknown message kind: " + tag);
}

json encode_client_message(const ClientMessage &message)
{
    switch (message.kind)
    {
    case ClientMessageKind::Hello:
        return json{{"Hello", message.port}};
    case ClientMessageKind::Authenticate:
        return json{{"Authenticate", message.tag}};
    case ClientMessageKind::Accept:
        return json{{"Accept", message.id.to_string()}};
    }
    throw std::logic_error("unhandled client message kind");
}

bool receive_server_message(FramedConnection &conn, ServerMessage &message, bool apply_timeout)
{
    std::string frame;
    if (!conn.receive(frame, apply_timeout))
        return false;
    message = decode_server_message(frame);
    return true;
}
