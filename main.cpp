#include <memory>
#include <string>
#include <thread>
#include <csignal>
#include <pthread.h>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "logging.hpp"
#include "network_utils.hpp"
#include "stop_signal.hpp"
#include "tunnels/tunnel_client.hpp"

namespace
{

// SIGINT and SIGTERM are blocked in every thread and consumed here instead.
void start_signal_watcher(StopSignal &stop)
{
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0)
    {
        log_warn("could not block SIGINT/SIGTERM; signals will terminate the process");
        return;
    }

    std::thread([signals, &stop]
                {
                    int received = 0;
                    if (sigwait(&signals, &received) == 0)
                    {
                        log_info(std::string("received ") + (received == SIGINT ? "SIGINT" : "SIGTERM") +
                                 ", shutting down");
                        stop.request_stop();
                    }
                })
        .detach();
}

} // namespace

int main(int argc, char *argv[])
{
    CLI::App app{"bore-client - expose a local TCP port through a remote relay"};

    app.set_version_flag("-v,--version", "1.0.0");

    ClientConfig config;
    std::string log_level = "info";

    auto local = app.add_subcommand("local", "Expose a local port on the relay");

    local->add_option("local_port", config.local_port, "Local port to expose")
        ->required()
        ->check(CLI::Range(1, 65535));

    local->add_option("-l,--local-host", config.local_host, "Local host to expose")
        ->capture_default_str();

    local->add_option("-t,--to", config.to, "Address of the relay server")
        ->required()
        ->envname("BORE_SERVER");

    local->add_option("-p,--port", config.desired_port, "Public port to request (0 lets the relay choose)")
        ->capture_default_str();

    local->add_option("-s,--secret", config.secret, "Shared secret for authentication")
        ->envname("BORE_SECRET");

    local->add_option("--control-port", config.control_port, "Control port of the relay server")
        ->capture_default_str();

    app.add_option("--log-level", log_level, "Log verbosity")
        ->capture_default_str()
        ->check(CLI::IsMember({"debug", "info", "warn", "error"}));

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    LogLevel level;
    if (parse_log_level(log_level, level))
        set_log_level(level);

    StopSignal stop;
    start_signal_watcher(stop);

    try
    {
        std::unique_ptr<TunnelClient> client = std::make_unique<TunnelClient>(config);
        log_info("listening at " + format_host_port(config.to, client->remote_port()));

        client->listen(stop);
    }
    catch (const std::exception &e)
    {
        log_error(e.what());
        return 1;
    }

    return 0;
}
