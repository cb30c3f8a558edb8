#ifndef AUTHENTICATOR_HPP
#define AUTHENTICATOR_HPP

#include <string>
#include <openssl/sha.h>
#include "uuid.hpp"

class FramedConnection;

// Answers relay challenges with HMAC-SHA256 keyed by SHA-256(secret).
class Authenticator
{
private:
    unsigned char key[SHA256_DIGEST_LENGTH];

public:
    explicit Authenticator(const std::string &secret);
    ~Authenticator();

    Authenticator(const Authenticator &) = delete;
    Authenticator &operator=(const Authenticator &) = delete;

    // Lower-case hex HMAC over the 16 raw bytes of the challenge.
    std::string answer(const Uuid &challenge) const;

    // Receives a Challenge on conn and replies with Authenticate.
    void client_handshake(FramedConnection &conn) const;
};

#endif
