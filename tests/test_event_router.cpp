#include <catch2/catch_test_macros.hpp>

#include "nav/event_router.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace wg;
using namespace wg::nav;

namespace {

class VectorSink : public EventSink {
public:
    void push(NavigationEvent event) override { events.push_back(std::move(event)); }
    std::vector<NavigationEvent> events;
};

NavSettings router_settings() {
    NavSettings s;
    s.debounce_ms = 1000;
    s.max_speed_mps = 3.0;
    return s;
}

} // namespace

// ================================================================
// Scans
// ================================================================

TEST_CASE("Router forwards scans as waypoint events", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_scan("A1", 100));
    REQUIRE(sink.events.size() == 1);
    auto* scan = std::get_if<WaypointScanned>(&sink.events[0]);
    REQUIRE(scan != nullptr);
    CHECK(scan->id.str() == "A1");
    CHECK(scan->at == 100);
}

TEST_CASE("Router debounces repeated scans", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    // Camera keeps seeing the same code for half a second.
    for (TimestampMs t = 0; t < 500; t += 50) {
        router.report_scan("A1", t);
    }
    CHECK(sink.events.size() == 1);
    CHECK(router.stats().scans_debounced == 9);

    // The window runs from the last sighting, not the last forwarded scan.
    CHECK_FALSE(router.report_scan("A1", 1200));
    CHECK(router.report_scan("A1", 2300));
    CHECK(sink.events.size() == 2);
}

TEST_CASE("Router forwards a code held in view only once", "[router]") {
    VectorSink sink;
    NavSettings settings;
    settings.debounce_ms = 1500;
    EventRouter router(sink, settings);

    // Seen every 100 ms for four seconds.
    for (TimestampMs t = 0; t < 4000; t += 100) {
        router.report_scan("A11", t);
    }
    CHECK(sink.events.size() == 1);
    CHECK(router.stats().scans_debounced == 39);

    // Looked away for two seconds, then back: a new scan.
    CHECK(router.report_scan("A11", 5900));
    CHECK(sink.events.size() == 2);
}

TEST_CASE("Router debounces per waypoint", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_scan("A1", 0));
    CHECK(router.report_scan("A2", 100));
    CHECK_FALSE(router.report_scan("A1", 200));
    CHECK(sink.events.size() == 2);
}

TEST_CASE("Router drops QR text that is not a waypoint", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK_FALSE(router.report_scan("https://example.com/menu", 0));
    CHECK_FALSE(router.report_scan("", 10));
    CHECK(sink.events.empty());
    CHECK(router.stats().scans_not_waypoint == 2);
}

TEST_CASE("Router drops out-of-order scans", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_scan("A1", 5000));
    CHECK_FALSE(router.report_scan("A2", 4000));
    CHECK(sink.events.size() == 1);
    CHECK(router.stats().out_of_order == 1);
}

// ================================================================
// Positions
// ================================================================

TEST_CASE("Router forwards plausible GPS samples", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_position(12.0, 77.0, 0));
    // ~11 m in 5 s: walking pace.
    CHECK(router.report_position(12.0001, 77.0, 5000));
    REQUIRE(sink.events.size() == 2);
    auto* pos = std::get_if<PositionSample>(&sink.events[1]);
    REQUIRE(pos != nullptr);
    CHECK(pos->position.lat == 12.0001);
    CHECK(pos->at == 5000);
}

TEST_CASE("Router rejects implausible GPS jumps", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    router.report_position(12.0, 77.0, 0);
    // A second, different fix at the same instant.
    CHECK_FALSE(router.report_position(12.00001, 77.0, 0));
    // ~111 m in 1 s.
    CHECK_FALSE(router.report_position(12.001, 77.0, 1000));
    // Out of range.
    CHECK_FALSE(router.report_position(91.0, 77.0, 2000));
    CHECK(sink.events.size() == 1);
    CHECK(router.stats().positions_implausible == 3);

    // Measured from the last accepted fix: after a minute the jump is fine.
    CHECK(router.report_position(12.001, 77.0, 60000));
    CHECK(sink.events.size() == 2);
}

TEST_CASE("Router recovers from a bogus first GPS fix", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    // A receiver without a fix reports 0,0.
    CHECK(router.report_position(0.0, 0.0, 1000));

    // Then ten minutes of walking at ~1 m/s at 1 Hz.
    int accepted = 0;
    for (int i = 1; i <= 600; ++i) {
        f64 lat = 12.97 + 0.000009 * i;
        if (router.report_position(lat, 77.59, 1000 + 1000 * i)) accepted++;
    }
    CHECK(accepted == 600 - (EventRouter::REANCHOR_FIXES - 1));
    CHECK(router.stats().positions_implausible ==
          static_cast<u64>(EventRouter::REANCHOR_FIXES - 1));
}

TEST_CASE("Router keeps its reference through scattered outliers", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_position(12.0, 77.0, 0));
    // Outliers that disagree with each other never take over.
    CHECK_FALSE(router.report_position(13.0, 77.0, 1000));
    CHECK_FALSE(router.report_position(11.0, 77.0, 2000));
    CHECK_FALSE(router.report_position(13.0, 78.0, 3000));
    CHECK(router.report_position(12.00001, 77.0, 4000));
    CHECK(router.stats().positions_implausible == 3);
}

TEST_CASE("Router drops out-of-order GPS samples", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    router.report_position(12.0, 77.0, 3000);
    CHECK_FALSE(router.report_position(12.0, 77.0, 2000));
    CHECK(router.stats().out_of_order == 1);
}

// ================================================================
// Commands and ordering
// ================================================================

TEST_CASE("Router normalizes spoken destinations", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    CHECK(router.report_destination("a 12", 0));
    CHECK_FALSE(router.report_destination("the kitchen please", 10));
    REQUIRE(sink.events.size() == 1);
    auto* dest = std::get_if<DestinationChosen>(&sink.events[0]);
    REQUIRE(dest != nullptr);
    CHECK(dest->id.str() == "A12");
    CHECK(router.stats().destinations_unrecognized == 1);
}

TEST_CASE("Router preserves arrival order across event kinds", "[router]") {
    VectorSink sink;
    EventRouter router(sink, router_settings());

    router.report_scan("A1", 0);
    router.report_destination("A3", 10);
    router.report_position(12.0, 77.0, 20);
    router.report_timeout(30);
    router.report_cancel("done", 40);

    REQUIRE(sink.events.size() == 5);
    CHECK(std::holds_alternative<WaypointScanned>(sink.events[0]));
    CHECK(std::holds_alternative<DestinationChosen>(sink.events[1]));
    CHECK(std::holds_alternative<PositionSample>(sink.events[2]));
    CHECK(std::holds_alternative<Timeout>(sink.events[3]));
    CHECK(std::holds_alternative<Cancelled>(sink.events[4]));
    CHECK(std::string(event_name(sink.events[4])) == "Cancelled");
    CHECK(event_time(sink.events[3]) == 30);
}

TEST_CASE("Router accepts concurrent producers", "[router]") {
    VectorSink sink;
    NavSettings settings = router_settings();
    settings.debounce_ms = 0;
    EventRouter router(sink, settings);

    std::thread camera([&] {
        for (int i = 1; i <= 200; ++i) router.report_scan("A" + std::to_string(i), i);
    });
    std::thread gps([&] {
        for (int i = 0; i < 200; ++i) router.report_position(12.0, 77.0, i * 1000);
    });
    camera.join();
    gps.join();

    auto stats = router.stats();
    CHECK(stats.scans_forwarded == 200);
    CHECK(stats.positions_forwarded == 200);
    CHECK(sink.events.size() == 400);
}
