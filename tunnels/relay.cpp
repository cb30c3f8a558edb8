#include "relay.hpp"
#include <atomic>
#include <exception>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "logging.hpp"

namespace
{

void copy_stream(Connection &from, Connection &to)
{
    std::vector<uint8_t> buffer(BUFFER_SIZE);
    for (;;)
    {
        ssize_t len = from.recv_data(buffer.data(), buffer.size());
        if (len == 0)
            return;
        to.send_all(buffer.data(), static_cast<size_t>(len));
    }
}

void close_both(Connection &a, Connection &b)
{
    if (!a.close())
        log_debug("relay: shutdown of fd " + std::to_string(a.get_fd()) + " failed");
    if (!b.close())
        log_debug("relay: shutdown of fd " + std::to_string(b.get_fd()) + " failed");
}

} // namespace

void relay_bidirectional(Connection &local, Connection &tunnel)
{
    std::exception_ptr errors[2];
    std::string messages[2];
    int finish_order[2] = {0, 0};
    std::atomic<int> finished{0};

    // Whichever direction ends first closes both sockets, which unblocks the
    // other one.
    auto pump = [&](Connection &from, Connection &to, int slot)
    {
        try
        {
            copy_stream(from, to);
        }
        catch (const std::exception &e)
        {
            errors[slot] = std::current_exception();
            messages[slot] = e.what();
        }
        finish_order[slot] = finished.fetch_add(1);
        close_both(local, tunnel);
    };

    std::thread tunnel_to_local(pump, std::ref(tunnel), std::ref(local), 1);
    pump(local, tunnel, 0);
    tunnel_to_local.join();

    int first = finish_order[0] < finish_order[1] ? 0 : 1;
    int second = 1 - first;
    if (errors[first])
        std::rethrow_exception(errors[first]);

    // The second direction usually fails only because both sockets were just
    // shut down under it.
    if (errors[second])
        log_debug("relay: discarding error after close: " + messages[second]);
}
