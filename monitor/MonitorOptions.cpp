// MonitorOptions.cpp - knxlink-monitor options provider with auto-registration
#include "MonitorOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_monitor_opts_mtx;
    std::string g_log_level = "info";
    std::vector<std::string> g_service_types;
    std::optional<std::string> g_send_hex;
    int g_duration_seconds = 0;
    std::atomic<bool> g_monitor_registered{false};
}

namespace monitor_opts {

void register_options() {
    bool expected = false;
    if (!g_monitor_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string level_default = "info";
        std::vector<std::string> types_default;
        int duration_default = 0;

        if (j.contains("logging")) {
            const auto& lj = j["logging"];
            if (lj.contains("level") && lj["level"].is_string()) level_default = lj["level"].get<std::string>();
        }
        if (j.contains("monitor")) {
            const auto& mj = j["monitor"];
            if (mj.contains("service_types") && mj["service_types"].is_array()) {
                for (const auto& t : mj["service_types"]) {
                    if (t.is_string()) types_default.push_back(t.get<std::string>());
                }
            }
            if (mj.contains("duration_seconds") && mj["duration_seconds"].is_number_integer()) {
                duration_default = mj["duration_seconds"].get<int>();
            }
        }

        {
            std::lock_guard<std::mutex> lk(g_monitor_opts_mtx);
            g_log_level = level_default;
            g_service_types = types_default;
            g_duration_seconds = duration_default;
            g_send_hex.reset();
        }

        app.add_option("--log-level", g_log_level, "Log level: debug, info, warning, error, critical (default info)")
            ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}, CLI::ignore_case))
            ->group("Logging");
        app.add_option("--service-type", g_service_types,
            "Only report these service types (name or number, repeatable)")
            ->group("Monitor");
        app.add_option("--send-hex", g_send_hex, "Send one KNXnet/IP frame given as hex after connecting")
            ->group("Monitor");
        app.add_option("--duration", g_duration_seconds, "Stop after N seconds (default 0 = until interrupted)")
            ->check(CLI::NonNegativeNumber)
            ->group("Monitor");
    });
}

std::string get_log_level() {
    std::lock_guard<std::mutex> lk(g_monitor_opts_mtx);
    return g_log_level;
}

std::vector<std::string> get_service_types() {
    std::lock_guard<std::mutex> lk(g_monitor_opts_mtx);
    return g_service_types;
}

std::optional<std::string> get_send_hex() {
    std::lock_guard<std::mutex> lk(g_monitor_opts_mtx);
    return g_send_hex;
}

int get_duration_seconds() {
    std::lock_guard<std::mutex> lk(g_monitor_opts_mtx);
    return g_duration_seconds;
}

} // namespace monitor_opts

// Static auto-registration object
namespace {
    struct MonitorOptsAutoReg {
        MonitorOptsAutoReg() { monitor_opts::register_options(); }
    };
    [[maybe_unused]] static MonitorOptsAutoReg s_monitor_auto_reg;
}
