#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/lua_state.hpp"
#include "lua/topology_loader.hpp"
#include "nav/waypoint_graph.hpp"
#include "service/console_adapter.hpp"
#include "service/log_voice.hpp"
#include "service/navigation_service.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace {

struct AppConfig {
    wg::fs::path topology = "data/topology.lua";
    wg::fs::path log_file = "wayguide.log";
    wg::fs::path replay;                       ///< empty = read stdin
    spdlog::level::level_enum log_level = spdlog::level::debug;
    std::optional<wg::i64> debounce_ms;
    std::optional<wg::f64> max_speed_mps;
    std::optional<wg::i64> scan_timeout_ms;
};

void print_usage() {
    std::cout << "WayGuide v0.1.0\n"
              << "Indoor QR-code navigation engine with spoken guidance\n\n"
              << "Usage:\n"
              << "  wayguide [options]\n\n"
              << "Options:\n"
              << "  --topology <path>        Lua topology file (default: data/topology.lua)\n"
              << "  --log-file <path>        Log file (default: wayguide.log, \"\" = console only)\n"
              << "  --log-level <name>       trace, debug, info, warn, error, critical, off\n"
              << "  --replay <path>          Read adapter commands from a file instead of stdin\n"
              << "  --debounce-ms <n>        Duplicate-scan window\n"
              << "  --max-speed <m/s>        GPS plausibility bound\n"
              << "  --scan-timeout-ms <n>    Idle time before a re-prompt\n"
              << "  --help                   Show this help message\n\n"
              << "Commands: scan <code> | dest <code> | gps <lat> <lon> | "
                 "cancel [reason] | wait <ms> | status | quit\n";
}

bool parse_number(const char* text, double& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0' && out >= 0;
}

AppConfig parse_args(int argc, char* argv[]) {
    AppConfig config;

    auto number_arg = [&](int& i, const char* flag) -> double {
        double val = 0;
        if (!parse_number(argv[++i], val)) {
            std::cerr << "Invalid " << flag << " value: " << argv[i] << "\n";
            std::exit(1);
        }
        return val;
    };

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--topology") == 0 && i + 1 < argc) {
            config.topology = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            auto level = wg::log::parse_level(argv[++i]);
            if (!level) {
                std::cerr << "Invalid --log-level value: " << argv[i] << "\n";
                std::exit(1);
            }
            config.log_level = *level;
        } else if (std::strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
            config.replay = argv[++i];
        } else if (std::strcmp(argv[i], "--debounce-ms") == 0 && i + 1 < argc) {
            config.debounce_ms = static_cast<wg::i64>(number_arg(i, "--debounce-ms"));
        } else if (std::strcmp(argv[i], "--max-speed") == 0 && i + 1 < argc) {
            config.max_speed_mps = number_arg(i, "--max-speed");
        } else if (std::strcmp(argv[i], "--scan-timeout-ms") == 0 && i + 1 < argc) {
            config.scan_timeout_ms =
                static_cast<wg::i64>(number_arg(i, "--scan-timeout-ms"));
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            std::exit(1);
        }
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config = parse_args(argc, argv);
    wg::log::init(config.log_file, config.log_level);

    // Malformed topology is a startup failure, never a runtime condition.
    wg::lua::LuaState lua_state;
    wg::lua::TopologyLoader loader;
    auto file = loader.load_file(lua_state, config.topology);
    if (!file) {
        spdlog::error("InvalidTopology: {}", file.error().message);
        wg::log::shutdown();
        return 1;
    }

    auto graph = wg::nav::WaypointGraph::load(file.value().topology);
    if (!graph) {
        spdlog::error("InvalidTopology: {}", graph.error().message);
        wg::log::shutdown();
        return 1;
    }
    auto shared_graph =
        std::make_shared<const wg::nav::WaypointGraph>(std::move(graph.value()));

    wg::nav::NavSettings settings = file.value().settings;
    if (config.debounce_ms) settings.debounce_ms = *config.debounce_ms;
    if (config.max_speed_mps) settings.max_speed_mps = *config.max_speed_mps;
    if (config.scan_timeout_ms) settings.scan_timeout_ms = *config.scan_timeout_ms;

    wg::service::LogVoiceOutput voice;
    wg::service::NavigationService service(shared_graph, voice, settings);
    wg::service::ConsoleAdapter console(service);

    service.start();

    if (!config.replay.empty()) {
        std::ifstream replay(config.replay);
        if (!replay) {
            spdlog::error("Failed to open replay file: {}", config.replay.string());
            service.stop();
            wg::log::shutdown();
            return 1;
        }
        spdlog::info("Replaying adapter commands from {}", config.replay.string());
        console.run(replay);
    } else {
        console.run(std::cin);
    }

    spdlog::info("Final: {}", wg::service::describe_snapshot(service));
    service.stop();
    spdlog::info("[System] Navigation ended.");
    wg::log::shutdown();
    return 0;
}
