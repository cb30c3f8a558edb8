#include "errors.hpp"

const char *error_code_name(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::IOError:
        return "IOError";
    case ErrorCode::TimedOut:
        return "TimedOut";
    case ErrorCode::FrameTooLarge:
        return "FrameTooLarge";
    case ErrorCode::EmptyFrame:
        return "EmptyFrame";
    case ErrorCode::UnexpectedEOF:
        return "UnexpectedEOF";
    case ErrorCode::UnexpectedUnitMessage:
        return "UnexpectedUnitMessage";
    case ErrorCode::MalformedMessage:
        return "MalformedMessage";
    case ErrorCode::InvalidUUID:
        return "InvalidUUID";
    case ErrorCode::UnexpectedHandshakeMessage:
        return "UnexpectedHandshakeMessage";
    case ErrorCode::AuthenticationRequired:
        return "AuthenticationRequired";
    case ErrorCode::ServerRejected:
        return "ServerRejected";
    case ErrorCode::UnexpectedInitialMessage:
        return "UnexpectedInitialMessage";
    case ErrorCode::ServerError:
        return "ServerError";
    }
    return "Unknown";
}

TunnelError::TunnelError(ErrorCode code, const std::string &message)
    : std::runtime_error(message), error_code(code)
{
}
