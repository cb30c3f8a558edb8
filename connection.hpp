#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <sys/types.h>

// One connected TCP stream socket.
//
// Deadlines are enforced with poll() before each blocking call. close() only
// shuts the socket down, so a thread blocked in recv_data() wakes up with end
// of stream; the descriptor itself is released by the destructor.
class Connection
{
private:
    int sockfd;
    std::atomic<bool> closed{false};
    bool has_read_deadline = false;
    bool has_write_deadline = false;
    std::chrono::steady_clock::time_point read_deadline;
    std::chrono::steady_clock::time_point write_deadline;

    void wait_ready(short events, std::chrono::steady_clock::time_point deadline, const char *what);

public:
    // Dials host:port, giving up after timeout_ms.
    Connection(const std::string &host, uint16_t port, int timeout_ms);
    // Takes ownership of an already connected socket.
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    void set_read_deadline(int timeout_ms);
    void set_write_deadline(int timeout_ms);
    void clear_read_deadline();
    void clear_deadlines();

    // Returns 0 at end of stream.
    ssize_t recv_data(uint8_t *buffer, size_t max_len);
    void send_all(const uint8_t *data, size_t len);

    // Shuts down both directions. Returns false if the shutdown failed for a
    // reason other than the peer already being gone.
    bool close();
    bool is_closed() const { return closed; }
    int get_fd() const { return sockfd; }
};

#endif
