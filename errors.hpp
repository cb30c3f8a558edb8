#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorCode
{
    IOError,
    TimedOut,
    FrameTooLarge,
    EmptyFrame,
    UnexpectedEOF,
    UnexpectedUnitMessage,
    MalformedMessage,
    InvalidUUID,
    UnexpectedHandshakeMessage,
    AuthenticationRequired,
    ServerRejected,
    UnexpectedInitialMessage,
    ServerError
};

const char *error_code_name(ErrorCode code);

class TunnelError : public std::runtime_error
{
private:
    ErrorCode error_code;

public:
    TunnelError(ErrorCode code, const std::string &message);
    ErrorCode code() const { return error_code; }
};

#endif
