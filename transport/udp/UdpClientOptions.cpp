// UdpClientOptions.cpp - UDP client options provider with auto-registration
#include "UdpClientOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_udp_opts_mtx;
    std::optional<std::string> g_udp_local_host;
    std::optional<int> g_udp_local_port;
    std::optional<std::string> g_udp_remote_host;
    std::optional<int> g_udp_remote_port;
    bool g_udp_multicast = true;
    std::optional<int> g_udp_io_poll_interval_ms;
    std::atomic<bool> g_udp_registered{false};
}

namespace udp_client_opts {

void register_options() {
    bool expected = false;
    if (!g_udp_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string local_host_default = "0.0.0.0";
        int local_port_default = 0;
        std::string remote_host_default = "224.0.23.12"; // KNX routing group
        int remote_port_default = 3671;
        bool multicast_default = true;
        int poll_default = 10;

        if (j.contains("udp_client")) {
            const auto& uj = j["udp_client"];
            if (uj.contains("local_host") && uj["local_host"].is_string()) local_host_default = uj["local_host"].get<std::string>();
            if (uj.contains("local_port") && uj["local_port"].is_number_integer()) local_port_default = uj["local_port"].get<int>();
            if (uj.contains("remote_host") && uj["remote_host"].is_string()) remote_host_default = uj["remote_host"].get<std::string>();
            if (uj.contains("remote_port") && uj["remote_port"].is_number_integer()) remote_port_default = uj["remote_port"].get<int>();
            if (uj.contains("multicast") && uj["multicast"].is_boolean()) multicast_default = uj["multicast"].get<bool>();
            if (uj.contains("io_poll_interval_ms") && uj["io_poll_interval_ms"].is_number_integer()) {
                int v = uj["io_poll_interval_ms"].get<int>();
                if (v > 0) poll_default = v; // override only if positive
            }
        }

        {
            std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
            g_udp_local_host = local_host_default;
            g_udp_local_port = local_port_default;
            g_udp_remote_host = remote_host_default;
            g_udp_remote_port = remote_port_default;
            g_udp_multicast = multicast_default;
            g_udp_io_poll_interval_ms = poll_default;
        }

        app.add_option("--local-host", g_udp_local_host, "Local bind address, or own interface IP for multicast (default 0.0.0.0)")->group("UDP client");
        app.add_option("--local-port", g_udp_local_port, "Local bind port (default 0 = ephemeral)")
            ->check(CLI::Range(0, 65535))
            ->group("UDP client");
        app.add_option("--remote-host", g_udp_remote_host, "Peer address or multicast group (default 224.0.23.12)")->group("UDP client");
        app.add_option("--remote-port", g_udp_remote_port, "Peer or group port (default 3671)")
            ->check(CLI::Range(0, 65535))
            ->group("UDP client");
        app.add_flag("--multicast,!--unicast", g_udp_multicast, "Join remote host as a multicast group (default) or talk unicast")->group("UDP client");
        app.add_option("--io-poll-interval-ms", g_udp_io_poll_interval_ms,
            "Idle poll interval of the I/O context (default = 10)")
            ->check(CLI::Range(1, 10000))
            ->group("UDP client");
    });
}

std::optional<std::string> get_local_host() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_local_host;
}

std::optional<int> get_local_port() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_local_port;
}

std::optional<std::string> get_remote_host() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_remote_host;
}

std::optional<int> get_remote_port() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_remote_port;
}

std::optional<bool> get_multicast() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_multicast;
}

std::optional<int> get_io_poll_interval_ms() {
    std::lock_guard<std::mutex> lk(g_udp_opts_mtx);
    return g_udp_io_poll_interval_ms;
}

} // namespace udp_client_opts

// Static auto-registration object
namespace {
    struct UdpClientOptsAutoReg {
        UdpClientOptsAutoReg() { udp_client_opts::register_options(); }
    };
    [[maybe_unused]] static UdpClientOptsAutoReg s_udp_client_auto_reg;
}
