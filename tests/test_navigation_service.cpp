#include <catch2/catch_test_macros.hpp>

#include "core/clock.hpp"
#include "service/console_adapter.hpp"
#include "service/event_queue.hpp"
#include "service/navigation_service.hpp"
#include "service/speech_queue.hpp"
#include "test_support.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

using namespace wg;
using namespace wg::service;
using namespace std::chrono_literals;
using wg::test::id;
using wg::test::RecordingVoice;

namespace {

std::shared_ptr<const nav::WaypointGraph> shared_triangle() {
    return std::make_shared<const nav::WaypointGraph>(wg::test::triangle_graph());
}

/// Poll until the recorded speech reaches `count` messages.
bool wait_for_speech(const RecordingVoice& voice, size_t count) {
    for (int i = 0; i < 200; ++i) {
        if (voice.count() >= count) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

// ================================================================
// Queues
// ================================================================

TEST_CASE("EventQueue is FIFO and reports drain", "[service]") {
    EventQueue queue;
    queue.push(nav::WaypointScanned{id("A1"), 1});
    queue.push(nav::Timeout{2});
    CHECK(queue.size() == 2);
    CHECK_FALSE(queue.wait_drained(0ms));

    auto first = queue.pop_for(10ms);
    REQUIRE(first.has_value());
    CHECK(std::holds_alternative<nav::WaypointScanned>(*first));
    queue.task_done();

    auto second = queue.pop_for(10ms);
    REQUIRE(second.has_value());
    CHECK(std::holds_alternative<nav::Timeout>(*second));
    queue.task_done();

    CHECK(queue.wait_drained(0ms));
    CHECK_FALSE(queue.pop_for(1ms).has_value());
}

TEST_CASE("EventQueue rejects pushes after close", "[service]") {
    EventQueue queue;
    queue.close();
    queue.push(nav::Timeout{1});
    CHECK(queue.closed());
    CHECK(queue.size() == 0);
    CHECK_FALSE(queue.pop_for(1ms).has_value());
}

TEST_CASE("SpeechQueue renders in order and drains on stop", "[service]") {
    RecordingVoice backend;
    SpeechQueue speech(backend);
    speech.start();
    speech.speak("one");
    speech.speak("two");
    speech.speak("three");
    speech.stop();

    auto spoken = backend.spoken();
    REQUIRE(spoken.size() == 3);
    CHECK(spoken[0] == "one");
    CHECK(spoken[2] == "three");
    CHECK(speech.spoken_count() == 3);
}

// ================================================================
// Service
// ================================================================

TEST_CASE("NavigationService drives a trip from reported events", "[service]") {
    RecordingVoice voice;
    NavigationService service(shared_triangle(), voice, nav::NavSettings{});
    service.start();
    REQUIRE(service.running());

    auto& router = service.router();
    TimestampMs t = now_ms();
    router.report_scan("A1", t);
    router.report_destination("a 3", t + 10);
    REQUIRE(service.wait_idle(2000ms));

    auto snap = service.snapshot();
    CHECK(snap.state == nav::SessionState::Navigating);
    CHECK(snap.current == id("A1"));
    CHECK(snap.next == id("A2"));

    router.report_scan("A2", t + 20);
    router.report_scan("A2", t + 30);   // camera re-trigger, debounced
    router.report_scan("A3", t + 40);
    REQUIRE(service.wait_idle(2000ms));

    snap = service.snapshot();
    CHECK(snap.state == nav::SessionState::Arrived);
    CHECK(service.router_stats().scans_debounced == 1);
    CHECK(service.processed_count() == 4);

    service.stop();
    CHECK_FALSE(service.running());

    // Start prompt + four transitions, all rendered before stop() returned.
    auto spoken = voice.spoken();
    REQUIRE(spoken.size() == 5);
    CHECK(spoken[0] == "please scan the starting code");
    CHECK(spoken[2] == "proceed to A2");
    CHECK(spoken[4] == "you have arrived");
}

TEST_CASE("NavigationService emits idle timeouts", "[service]") {
    RecordingVoice voice;
    nav::NavSettings settings;
    settings.scan_timeout_ms = 50;
    NavigationService service(shared_triangle(), voice, settings);
    service.start();

    std::this_thread::sleep_for(500ms);
    CHECK(service.router_stats().timeouts >= 2);
    // Idle session: timeouts are advisory and change nothing.
    CHECK(service.snapshot().state == nav::SessionState::Idle);
    service.stop();
}

TEST_CASE("ConsoleAdapter replays adapter commands", "[service]") {
    RecordingVoice voice;
    NavigationService service(shared_triangle(), voice, nav::NavSettings{});
    ConsoleAdapter console(service);
    service.start();

    std::istringstream script(
        "# triangle walk\n"
        "scan A1\n"
        "dest kitchen\n"
        "dest A3\n"
        "gps 12.0 77.0\n"
        "gps not-a-number 1\n"
        "scan A2\n"
        "status\n"
        "frobnicate\n"
        "quit\n"
        "scan A3\n");
    u64 executed = console.run(script);
    CHECK(executed == 10);
    CHECK(console.rejected_count() == 2);

    auto snap = service.snapshot();
    CHECK(snap.state == nav::SessionState::Navigating);
    CHECK(snap.current == id("A2"));
    REQUIRE(snap.last_position.has_value());
    CHECK(describe_snapshot(service).find("state=Navigating") == 0);

    REQUIRE(wait_for_speech(voice, 5));
    service.stop();

    bool reprompted = false;
    for (const auto& text : voice.spoken()) {
        if (text == "invalid destination code, please try again") reprompted = true;
    }
    CHECK(reprompted);
}
