// monitorMain.cpp - knxlink-monitor: open a KNXnet/IP UDP client and log every frame it receives.
#include "MonitorOptions.hpp"
#include "knxip/KnxIpCodec.hpp"
#include "options/Options.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/io/IoContext.hpp"
#include "transport/udp/UdpClient.hpp"
#include "transport/udp/UdpClientOptions.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <set>
#include <thread>

using KnxLink::KnxIp::KnxIpFrame;
using KnxLink::KnxIp::ServiceType;

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("knxlink.monitor");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---
        udp_client_opts::register_options();
        monitor_opts::register_options();

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        stdout_sink->set_level(log_level_from_string(monitor_opts::get_log_level()));

        std::set<ServiceType> filter;
        for (const auto& name : monitor_opts::get_service_types()) {
            auto type = KnxLink::KnxIp::parse_service_type(name);
            if (!type) {
                logger->error("Unknown service type: " + name);
                return 2;
            }
            filter.insert(*type);
        }

        std::optional<KnxIpFrame> to_send;
        if (auto hex = monitor_opts::get_send_hex()) {
            auto bytes = KnxLink::KnxIp::from_hex(*hex);
            if (!bytes) {
                logger->error("--send-hex is not a hex string");
                return 2;
            }
            try {
                to_send = KnxLink::KnxIp::KnxIpCodec().decode(*bytes);
            } catch (const KnxLink::KnxIp::CouldNotParseKnxIp& e) {
                logger->error(std::string("--send-hex: ") + e.what());
                return 2;
            }
        }

        std::optional<transport::Address> local;
        std::optional<transport::Address> remote;
        try {
            local.emplace(udp_client_opts::get_local_host().value_or("0.0.0.0"), udp_client_opts::get_local_port().value_or(0));
            remote.emplace(udp_client_opts::get_remote_host().value_or("224.0.23.12"), udp_client_opts::get_remote_port().value_or(3671));
        } catch (const transport::ConfigurationError& e) {
            logger->error(std::string("Invalid address: ") + e.what());
            return 2;
        }
        const bool multicast = udp_client_opts::get_multicast().value_or(true);

        // --- Stage 3: Bring up I/O context and client ---
        auto io = std::make_shared<transport::IoContext>();
        io->set_logger(logger->child("knxlink.io"));
        io->set_poll_interval(std::chrono::milliseconds(udp_client_opts::get_io_poll_interval_ms().value_or(10)));
        io->start();

        auto client = transport::UdpClient::create(*local, *remote, multicast, transport::LogChannels::from(logger), io);
        client->register_callback([logger](const KnxIpFrame& frame, transport::UdpClient&) {
            logger->info(frame.to_string());
        }, filter);

        try {
            client->connect();
        } catch (const transport::SocketError& e) {
            logger->error(std::string("Failed to connect: ") + e.what());
            io->stop();
            return 3;
        } catch (const transport::ConfigurationError& e) {
            logger->error(std::string("Invalid multicast address: ") + e.what());
            io->stop();
            return 2;
        }

        auto bound = client->get_local_address();
        logger->info(std::string(multicast ? "Listening on group " : "Talking to ") + remote->to_string() +
                     (bound ? " (local " + bound->to_string() + ")" : std::string()));

        if (to_send) {
            client->send(*to_send);
            logger->info("Sent " + to_send->to_string());
        }

        // --- Stage 4: Run until signal or duration ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        const int duration = monitor_opts::get_duration_seconds();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
        while (!shutdown_requested.load(std::memory_order_relaxed)) {
            if (duration > 0 && std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        logger->info("Shutting down monitor...");
        client->stop();
        // give the poller one pass to observe the close
        std::this_thread::sleep_for(io->poll_interval() * 2);
        io->log_statistics();
        logger->info("Unhandled frames: " + std::to_string(client->unhandled_count()));
        io->stop();

    } catch (const std::exception& e) {
        logger->error("Exception in knxlink-monitor: " + std::string(e.what()));
        return 1;
    }

    // --- Stage 5: Final shutdown log ---
    logger->info("knxlink-monitor shut down successfully");
    return 0;
}
