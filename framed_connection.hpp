#ifndef FRAMED_CONNECTION_HPP
#define FRAMED_CONNECTION_HPP

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "connection.hpp"

// Null-delimited JSON framing on top of a Connection.
//
// Reads are buffered, so bytes that arrived after the last frame stay in
// read_buffer until drain_buffered() hands them out.
class FramedConnection
{
private:
    std::unique_ptr<Connection> conn;
    std::vector<uint8_t> read_buffer;
    int timeout_ms;

public:
    explicit FramedConnection(std::unique_ptr<Connection> conn, int timeout_ms = NETWORK_TIMEOUT_MS);

    // Serializes value and writes it followed by a zero byte. Any write
    // failure, including the deadline passing, is an IOError.
    void send(const nlohmann::json &value);

    // Reads the next frame into frame. Returns false if the peer closed the
    // stream before sending anything. With apply_timeout the read is bounded
    // by timeout_ms, otherwise it may block indefinitely.
    bool receive(std::string &frame, bool apply_timeout);

    std::vector<uint8_t> drain_buffered();

    bool close();
    Connection &connection() { return *conn; }
};

#endif
