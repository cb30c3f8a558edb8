#include "authenticator.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include "errors.hpp"
#include "framed_connection.hpp"
#include "protocol.hpp"

namespace
{

std::string to_hex(const unsigned char *data, size_t len)
{
    static const char digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

} // namespace

Authenticator::Authenticator(const std::string &secret)
{
    unsigned int key_len = 0;
    if (EVP_Digest(secret.data(), secret.size(), key, &key_len, EVP_sha256(), nullptr) != 1 ||
        key_len != sizeof(key))
    {
        throw std::runtime_error("SHA-256 key derivation failed");
    }
}

Authenticator::~Authenticator()
{
    OPENSSL_cleanse(key, sizeof(key));
}

std::string Authenticator::answer(const Uuid &challenge) const
{
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    const auto &bytes = challenge.data();
    if (HMAC(EVP_sha256(), key, sizeof(key), bytes.data(), bytes.size(), mac, &mac_len) == nullptr)
    {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return to_hex(mac, mac_len);
}

void Authenticator::client_handshake(FramedConnection &conn) const
{
    ServerMessage message;
    if (!receive_server_message(conn, message, true))
    {
        throw TunnelError(ErrorCode::UnexpectedEOF, "unexpected EOF from server");
    }
    if (message.kind != ServerMessageKind::Challenge)
    {
        throw TunnelError(ErrorCode::UnexpectedHandshakeMessage,
                          std::string("unexpected handshake message: ") +
                              server_message_kind_name(message.kind));
    }

    conn.send(encode_client_message(ClientMessage::authenticate(answer(message.id))));
}
