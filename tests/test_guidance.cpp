#include <catch2/catch_test_macros.hpp>

#include "nav/guidance.hpp"
#include "test_support.hpp"

using namespace wg;
using namespace wg::nav;
using wg::test::id;
using wg::test::RecordingVoice;

namespace {

WaypointGraph labelled_graph() {
    TopologySpec spec;
    spec.waypoints.push_back({"A1", "Room 515", std::nullopt});
    spec.waypoints.push_back({"A12", "Lift", std::nullopt});
    return WaypointGraph::load(spec).value();
}

TransitionContext ctx_for(Cause cause) {
    TransitionContext ctx;
    ctx.cause = cause;
    ctx.current = id("A1");
    ctx.next = id("A12");
    ctx.destination = id("A12");
    return ctx;
}

} // namespace

TEST_CASE("Guidance phrases every transition", "[guidance]") {
    auto graph = labelled_graph();
    RecordingVoice voice;
    GuidanceEmitter emitter(graph, voice);

    auto text = [&](SessionState from, SessionState to, Cause cause) {
        return emitter.compose(from, to, ctx_for(cause)).text;
    };

    CHECK(text(SessionState::Idle, SessionState::AwaitingDestination, Cause::Started) ==
          "at Room 515, please say your destination code");
    CHECK(text(SessionState::AwaitingDestination, SessionState::Navigating,
               Cause::RouteComputed) == "proceed to Lift");
    CHECK(text(SessionState::Navigating, SessionState::Deviated, Cause::Deviated) ==
          "off route, rescanning");
    CHECK(text(SessionState::Navigating, SessionState::Arrived, Cause::Arrived) ==
          "you have arrived");
    CHECK(text(SessionState::Navigating, SessionState::Aborted, Cause::Cancelled) ==
          "navigation cancelled");
    CHECK(text(SessionState::Deviated, SessionState::Aborted, Cause::RerouteFailed) ==
          "no path to destination from here, navigation ended");
    CHECK(text(SessionState::AwaitingDestination, SessionState::AwaitingDestination,
               Cause::NoPath) == "no path found to Lift");
    CHECK(text(SessionState::AwaitingDestination, SessionState::AwaitingDestination,
               Cause::SameAsOrigin) == "you are already at Room 515");
    CHECK(text(SessionState::Navigating, SessionState::Navigating, Cause::Nudge) ==
          "please scan the next code, Lift");

    // compose() alone never speaks.
    CHECK(voice.count() == 0);
}

TEST_CASE("Guidance kinds follow the transition", "[guidance]") {
    auto graph = labelled_graph();
    RecordingVoice voice;
    GuidanceEmitter emitter(graph, voice);

    CHECK(emitter.compose(SessionState::Idle, SessionState::AwaitingDestination,
                          ctx_for(Cause::Started)).kind == GuidanceKind::PromptDestination);
    CHECK(emitter.compose(SessionState::Deviated, SessionState::Navigating,
                          ctx_for(Cause::Rerouted)).kind == GuidanceKind::Proceed);
    CHECK(emitter.compose(SessionState::Navigating, SessionState::Arrived,
                          ctx_for(Cause::Arrived)).kind == GuidanceKind::Arrived);
    CHECK(emitter.compose(SessionState::Navigating, SessionState::Aborted,
                          ctx_for(Cause::Cancelled)).kind == GuidanceKind::Aborted);
    CHECK(emitter.compose(SessionState::AwaitingDestination,
                          SessionState::AwaitingDestination,
                          ctx_for(Cause::NoPath)).kind == GuidanceKind::Error);
}

TEST_CASE("Guidance includes the turn hint and distance", "[guidance]") {
    auto graph = labelled_graph();
    RecordingVoice voice;
    GuidanceEmitter emitter(graph, voice);

    auto ctx = ctx_for(Cause::Advanced);
    ctx.hint = "turn right for the lift";
    CHECK(emitter.compose(SessionState::Navigating, SessionState::Navigating, ctx).text ==
          "turn right for the lift, then proceed to Lift");

    ctx = ctx_for(Cause::Approaching);
    ctx.distance_m = 12.4;
    CHECK(emitter.compose(SessionState::Navigating, SessionState::Navigating, ctx).text ==
          "getting closer to Lift, about 12 metres");

    ctx = ctx_for(Cause::Nudge);
    ctx.next.reset();
    CHECK(emitter.compose(SessionState::Deviated, SessionState::Deviated, ctx).text ==
          "please scan the nearest code");
}

TEST_CASE("Guidance emits exactly one message per transition", "[guidance]") {
    auto graph = labelled_graph();
    RecordingVoice voice;
    GuidanceEmitter emitter(graph, voice);

    auto msg = emitter.on_transition(SessionState::Navigating, SessionState::Arrived,
                                     ctx_for(Cause::Arrived));
    CHECK(msg.text == "you have arrived");
    REQUIRE(voice.count() == 1);
    CHECK(voice.last() == "you have arrived");
    CHECK(emitter.emitted_count() == 1);

    emitter.on_transition(SessionState::Arrived, SessionState::AwaitingDestination,
                          ctx_for(Cause::Started));
    CHECK(voice.count() == 2);
}
