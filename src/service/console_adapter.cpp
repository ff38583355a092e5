#include "service/console_adapter.hpp"
#include "core/clock.hpp"
#include "nav/waypoint_graph.hpp"
#include "service/navigation_service.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <istream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>

namespace wg::service {

namespace {

constexpr std::chrono::milliseconds SETTLE_TIMEOUT{2000};

bool parse_double(const std::string& text, f64& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

std::string rest_of(std::istringstream& in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

} // namespace

ConsoleAdapter::ConsoleAdapter(NavigationService& service) : service_(service) {}

bool ConsoleAdapter::execute(std::string_view line) {
    std::istringstream in{std::string(line)};
    std::string cmd;
    if (!(in >> cmd) || cmd[0] == '#') return true;

    auto& router = service_.router();
    const TimestampMs now = now_ms();

    if (cmd == "scan") {
        std::string code;
        in >> code;
        router.report_scan(code, now);
    } else if (cmd == "dest") {
        std::string phrase = rest_of(in);
        spdlog::info("Recognized (voice): {}", phrase);
        if (!router.report_destination(phrase, now)) {
            service_.voice().speak("invalid destination code, please try again");
        }
    } else if (cmd == "gps") {
        std::string lat_text, lon_text;
        in >> lat_text >> lon_text;
        f64 lat = 0, lon = 0;
        if (!parse_double(lat_text, lat) || !parse_double(lon_text, lon)) {
            spdlog::warn("Console: usage: gps <lat> <lon>");
            rejected_++;
            return true;
        }
        router.report_position(lat, lon, now);
    } else if (cmd == "cancel") {
        router.report_cancel(rest_of(in), now);
    } else if (cmd == "wait") {
        std::string ms_text;
        in >> ms_text;
        f64 ms = 0;
        if (!parse_double(ms_text, ms) || ms < 0) {
            spdlog::warn("Console: usage: wait <ms>");
            rejected_++;
            return true;
        }
        service_.wait_idle(SETTLE_TIMEOUT);
        std::this_thread::sleep_for(
            std::chrono::milliseconds(static_cast<i64>(ms)));
    } else if (cmd == "status") {
        log_status();
    } else if (cmd == "quit" || cmd == "exit") {
        return false;
    } else {
        spdlog::warn("Console: unknown command '{}'", cmd);
        rejected_++;
    }
    return true;
}

u64 ConsoleAdapter::run(std::istream& in) {
    u64 executed = 0;
    std::string line;
    while (std::getline(in, line)) {
        executed++;
        if (!execute(line)) break;
    }
    service_.wait_idle(SETTLE_TIMEOUT);
    return executed;
}

void ConsoleAdapter::log_status() {
    service_.wait_idle(SETTLE_TIMEOUT);
    spdlog::info("Status: {}", describe_snapshot(service_));
}

std::string describe_snapshot(const NavigationService& service) {
    const auto snap = service.snapshot();
    const auto& graph = service.graph();

    std::ostringstream ss;
    ss << "state=" << nav::session_state_name(snap.state);
    if (snap.current) {
        ss << " current=" << snap.current->str() << " ("
           << graph.label(*snap.current) << ")";
    }
    if (snap.destination) ss << " destination=" << snap.destination->str();
    if (snap.next) ss << " next=" << snap.next->str();
    if (!snap.route.empty()) {
        ss << " progress=" << std::min(snap.route_index, snap.route.size())
           << "/" << snap.route.size() << " cost=" << snap.route_cost;
    }
    ss << " deviations=" << snap.deviations;
    if (snap.last_position) {
        ss << " gps=" << snap.last_position->lat << ","
           << snap.last_position->lon;
    }
    return ss.str();
}

} // namespace wg::service
