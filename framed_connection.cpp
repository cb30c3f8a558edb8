#include "framed_connection.hpp"
#include <algorithm>
#include "errors.hpp"

FramedConnection::FramedConnection(std::unique_ptr<Connection> conn, int timeout_ms)
    : conn(std::move(conn)), timeout_ms(timeout_ms)
{
}

void FramedConnection::send(const nlohmann::json &value)
{
    std::string payload = value.dump();
    if (payload.size() > MAX_FRAME_LENGTH)
    {
        throw TunnelError(ErrorCode::FrameTooLarge,
                          "frame too large: " + std::to_string(payload.size()) + " bytes");
    }

    payload.push_back('\0');
    conn->set_write_deadline(timeout_ms);
    try
    {
        conn->send_all(reinterpret_cast<const uint8_t *>(payload.data()), payload.size());
    }
    catch (const TunnelError &e)
    {
        // A stalled write is a transport failure like any other.
        if (e.code() == ErrorCode::TimedOut)
            throw TunnelError(ErrorCode::IOError, "write timed out");
        throw;
    }
}

bool FramedConnection::receive(std::string &frame, bool apply_timeout)
{
    if (apply_timeout)
        conn->set_read_deadline(timeout_ms);
    else
        conn->clear_read_deadline();

    size_t scanned = 0;
    for (;;)
    {
        auto terminator = std::find(read_buffer.begin() + scanned, read_buffer.end(), 0);
        if (terminator != read_buffer.end())
        {
            size_t len = terminator - read_buffer.begin();
            if (len == 0)
            {
                throw TunnelError(ErrorCode::EmptyFrame, "empty frame");
            }
            if (len > MAX_FRAME_LENGTH)
            {
                throw TunnelError(ErrorCode::FrameTooLarge, "frame too large: " + std::to_string(len) + " bytes");
            }

            frame.assign(read_buffer.begin(), terminator);
            read_buffer.erase(read_buffer.begin(), terminator + 1);
            return true;
        }

        if (read_buffer.size() > MAX_FRAME_LENGTH)
        {
            throw TunnelError(ErrorCode::FrameTooLarge,
                              "frame too large: more than " + std::to_string(MAX_FRAME_LENGTH) + " bytes");
        }
        scanned = read_buffer.size();

        uint8_t chunk[FRAME_READ_CHUNK];
        ssize_t len = conn->recv_data(chunk, sizeof(chunk));
        if (len == 0)
        {
            if (read_buffer.empty())
                return false;
            throw TunnelError(ErrorCode::UnexpectedEOF, "connection closed in the middle of a frame");
        }
        read_buffer.insert(read_buffer.end(), chunk, chunk + len);
    }
}

std::vector<uint8_t> FramedConnection::drain_buffered()
{
    std::vector<uint8_t> buffered;
    buffered.swap(read_buffer);
    return buffered;
}

bool FramedConnection::close()
{
    return conn->close();
}
