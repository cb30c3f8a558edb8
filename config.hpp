#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Default TCP port of the relay's control channel.
constexpr uint16_t CONTROL_PORT = 7835;

// Longest JSON payload allowed in a frame, terminator excluded.
constexpr size_t MAX_FRAME_LENGTH = 256;

// Bound for dialing, handshake and initial-response steps.
constexpr int NETWORK_TIMEOUT_MS = 3000;

constexpr int BUFFER_SIZE = 65536;
constexpr int FRAME_READ_CHUNK = 4096;

struct ClientConfig
{
    std::string local_host = "localhost";
    uint16_t local_port = 0;
    std::string to;
    uint16_t control_port = CONTROL_PORT;
    uint16_t desired_port = 0; // 0 lets the relay choose
    std::string secret;        // empty disables authentication
};

#endif
