/**
 * @file test_monitor_options.cpp
 * @brief JSON config loading, CLI overrides and parse errors for the monitor's option providers.
 */

#include "MonitorOptions.hpp"
#include "options/Options.hpp"
#include "transport/udp/UdpClientOptions.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using shared_opts::Options;

namespace {

/** Run the strict parse over `args` as if given after the program name. */
Options::ParseResult parse(const std::vector<std::string>& args, std::string& err) {
    std::vector<std::string> storage;
    storage.push_back("knxlink-monitor");
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : storage) argv.push_back(arg.data());
    err.clear();
    return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
}

std::filesystem::path write_temp_file(const std::string& stem, const std::string& content) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(stamp) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

const char* kConfig = R"({
    "udp_client": {
        "local_host": "192.168.1.10",
        "local_port": 3700,
        "remote_host": "224.0.23.12",
        "remote_port": 3671,
        "multicast": false,
        "io_poll_interval_ms": 25
    },
    "logging": { "level": "debug" },
    "monitor": {
        "service_types": ["SEARCH_REQUEST", "0x0530"],
        "duration_seconds": 5
    }
})";

void test_defaults() {
    std::cout << "\n=== Test 1: defaults without a config file ===\n";
    std::string err;
    assert(parse({}, err) == Options::ParseResult::Ok);
    assert(udp_client_opts::get_local_host() == std::string("0.0.0.0"));
    assert(udp_client_opts::get_local_port() == 0);
    assert(udp_client_opts::get_remote_host() == std::string("224.0.23.12"));
    assert(udp_client_opts::get_remote_port() == 3671);
    assert(udp_client_opts::get_multicast() == true);
    assert(udp_client_opts::get_io_poll_interval_ms() == 10);
    assert(monitor_opts::get_log_level() == "info");
    assert(monitor_opts::get_service_types().empty());
    assert(!monitor_opts::get_send_hex());
    assert(monitor_opts::get_duration_seconds() == 0);
    assert(!Options::get_config_file());
}

void test_config_file(const std::filesystem::path& config) {
    std::cout << "\n=== Test 2: values from the JSON config file ===\n";
    std::string err;
    assert(parse({"-c", config.string()}, err) == Options::ParseResult::Ok);
    assert(udp_client_opts::get_local_host() == std::string("192.168.1.10"));
    assert(udp_client_opts::get_local_port() == 3700);
    assert(udp_client_opts::get_multicast() == false);
    assert(udp_client_opts::get_io_poll_interval_ms() == 25);
    assert(monitor_opts::get_log_level() == "debug");
    assert((monitor_opts::get_service_types() == std::vector<std::string>{"SEARCH_REQUEST", "0x0530"}));
    assert(monitor_opts::get_duration_seconds() == 5);
    assert(Options::get_config_file() == std::filesystem::absolute(config));
}

void test_cli_overrides(const std::filesystem::path& config) {
    std::cout << "\n=== Test 3: command line overrides the config file ===\n";
    std::string err;
    assert(parse({"--config", config.string(), "--remote-host", "knx.local", "--remote-port", "3672", "--multicast",
                  "--log-level", "warning", "--service-type", "ROUTING_INDICATION", "--duration", "1",
                  "--send-hex", "06100201000e"},
                 err) == Options::ParseResult::Ok);
    assert(udp_client_opts::get_local_host() == std::string("192.168.1.10")); // untouched, from JSON
    assert(udp_client_opts::get_remote_host() == std::string("knx.local"));
    assert(udp_client_opts::get_remote_port() == 3672);
    assert(udp_client_opts::get_multicast() == true);
    assert(monitor_opts::get_log_level() == "warning");
    assert((monitor_opts::get_service_types() == std::vector<std::string>{"ROUTING_INDICATION"}));
    assert(monitor_opts::get_duration_seconds() == 1);
    assert(monitor_opts::get_send_hex() == std::string("06100201000e"));

    // a later parse without --send-hex forgets the previous frame
    assert(parse({"--unicast"}, err) == Options::ParseResult::Ok);
    assert(!monitor_opts::get_send_hex());
    assert(udp_client_opts::get_multicast() == false);
    assert(udp_client_opts::get_remote_host() == std::string("224.0.23.12"));
}

void test_parse_errors(const std::filesystem::path& malformed) {
    std::cout << "\n=== Test 4: config and command line errors ===\n";
    std::string err;

    assert(parse({"-c", "/nonexistent/knxlink/monitor.json"}, err) == Options::ParseResult::Error);
    std::cout << "  " << err << "\n";
    assert(err.find("cannot open config file") != std::string::npos);

    assert(parse({"-c", malformed.string()}, err) == Options::ParseResult::Error);
    std::cout << "  " << err << "\n";
    assert(err.find("malformed config file") != std::string::npos);

    const std::vector<std::vector<std::string>> bad_command_lines = {
        {"--no-such-option"},
        {"--remote-port", "70000"},
        {"--local-port", "-1"},
        {"--io-poll-interval-ms", "0"},
        {"--log-level", "loud"},
        {"--duration", "-1"},
        {"stray-positional"},
    };
    for (const auto& args : bad_command_lines) {
        assert(parse(args, err) == Options::ParseResult::Error);
        assert(!err.empty());
        std::cout << "  " << args[0] << ": " << err << "\n";
    }
}

} // namespace

int main() {
    udp_client_opts::register_options();
    monitor_opts::register_options();
    udp_client_opts::register_options(); // repeated registration adds nothing

    const auto config = write_temp_file("knxlink_monitor_config", kConfig);
    const auto malformed = write_temp_file("knxlink_monitor_malformed", "{ \"udp_client\": { \"local_port\": ");

    test_defaults();
    test_config_file(config);
    test_cli_overrides(config);
    test_parse_errors(malformed);

    std::error_code ec;
    std::filesystem::remove(config, ec);
    std::filesystem::remove(malformed, ec);
    std::cout << "\nAll option tests passed!\n";
    return 0;
}
