#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "sprout/core/error.hpp"
#include "sprout/state/builder.hpp"
#include <string>
#include <vector>

using namespace sprout;

TEST_CASE("Automaton: Enable enters the initial state") {
    std::vector<std::string> log;
    state::Builder builder;
    auto idle = builder.addState().whenEntered([&log] { log.push_back("enter idle"); }).build();
    auto automaton = builder.initialState(idle).build();

    CHECK_FALSE(automaton->isEnabled());
    CHECK(automaton->currentState() == nullptr);

    automaton->enable();

    CHECK(automaton->isEnabled());
    CHECK(automaton->currentState() == idle);
    std::vector<std::string> expected{"enter idle"};
    CHECK(log == expected);
}

TEST_CASE("Automaton: Enable twice fails") {
    state::Builder builder;
    auto s = builder.addState().build();
    auto automaton = builder.initialState(s).build();

    automaton->enable();
    CHECK_THROWS_WITH_AS(automaton->enable(), "Automaton already enabled!", std::logic_error);
    CHECK(automaton->isEnabled());
}

TEST_CASE("Automaton: Post requires enable and a non-empty event") {
    state::Builder builder;
    auto s = builder.addState().build();
    auto automaton = builder.initialState(s).build();

    CHECK_THROWS_WITH_AS(automaton->post("hello"), "Automaton must be enabled first!", std::logic_error);

    automaton->enable();
    CHECK_THROWS_WITH_AS(automaton->post(state::Event()), "Event must not be empty!", std::invalid_argument);
    CHECK_NOTHROW(automaton->post("hello"));
}

TEST_CASE("Automaton: Null events are rejected as empty") {
    int fired = 0;
    state::Builder builder;
    auto s = builder.addState().build();
    builder.addTransition().from(s).to(s).execute([&fired](const state::Event &) { ++fired; }).build();
    auto automaton = builder.initialState(s).build();
    automaton->enable();

    const char *missing = nullptr;
    CHECK_THROWS_WITH_AS(automaton->post(nullptr), "Event must not be empty!", std::invalid_argument);
    CHECK_THROWS_WITH_AS(automaton->post(missing), "Event must not be empty!", std::invalid_argument);
    CHECK(fired == 0);

    automaton->post("present");
    CHECK(fired == 1);
}

TEST_CASE("Automaton: Greeter self-transition") {
    std::vector<std::string> greetings;
    state::Builder builder;
    auto s = builder.addState().build();
    builder.addTransition()
        .from(s)
        .to(s)
        .on<std::string>()
        .check([](const std::string &e) { return !e.empty(); })
        .execute([&greetings](const std::string &e) { greetings.push_back("Hello, " + e + "!"); })
        .build();
    auto automaton = builder.initialState(s).build();
    automaton->enable();

    automaton->post("");
    CHECK(greetings.empty());
    CHECK(automaton->currentState() == s);

    automaton->post("Sam");
    std::vector<std::string> expected{"Hello, Sam!"};
    CHECK(greetings == expected);
    CHECK(automaton->currentState() == s);

    // Not a string: filtered out before the guard
    automaton->post(12);
    CHECK(greetings.size() == 1);
}

TEST_CASE("Automaton: Self-transition fires no entry or exit actions") {
    std::vector<std::string> log;
    state::Builder builder;
    auto s = builder.addState()
                 .whenEntered([&log] { log.push_back("enter"); })
                 .whenExited([&log] { log.push_back("exit"); })
                 .build();
    state::StatePtr seenDuringAction;
    state::Automaton *automatonPtr = nullptr;
    builder.addTransition()
        .from(s)
        .to(s)
        .execute([&](const state::Event &) {
            log.push_back("action");
            seenDuringAction = automatonPtr->currentState();
        })
        .build();
    auto automaton = builder.initialState(s).build();
    automatonPtr = automaton.get();

    automaton->enable();
    log.clear();
    automaton->post(1);

    std::vector<std::string> expected{"action"};
    CHECK(log == expected);
    CHECK(seenDuringAction == s);
}

TEST_CASE("Automaton: Light bulb") {
    std::vector<std::string> log;
    state::Builder builder;
    auto off = builder.addState().named("OFF").whenEntered([&log] { log.push_back("entry OFF"); }).build();
    auto on = builder.addState().named("ON").whenEntered([&log] { log.push_back("entry ON"); }).build();
    builder.addTransition().from(off).to(on).check(state::Guards::equals("on")).build();
    builder.addTransition().from(on).to(off).check(state::Guards::equals("off")).build();
    auto automaton = builder.initialState(off).build();

    automaton->enable();
    CHECK(automaton->currentState() == off);
    log.clear();

    automaton->post("off");
    CHECK(automaton->currentState() == off);
    CHECK(log.empty());

    automaton->post("on");
    CHECK(automaton->currentState() == on);
    std::vector<std::string> expected{"entry ON"};
    CHECK(log == expected);

    automaton->post("on");
    CHECK(automaton->currentState() == on);
    CHECK(log.size() == 1);

    automaton->post("off");
    CHECK(automaton->currentState() == off);
    CHECK(log.back() == "entry OFF");
}

TEST_CASE("Automaton: Engine transition ordering") {
    enum class Started { Yes };

    std::vector<std::string> log;
    state::Automaton *engine = nullptr;
    auto snapshot = [&engine]() -> std::string {
        auto current = engine->currentState();
        return current ? current->name() : "<undefined>";
    };

    state::Builder builder;
    auto off = builder.addState()
                   .named("OFF")
                   .whenEntered([&] { log.push_back("entry OFF in " + snapshot()); })
                   .whenExited([&] { log.push_back("exit OFF in " + snapshot()); })
                   .build();
    auto cranking = builder.addState()
                        .named("CRANKING")
                        .whenEntered([&] { log.push_back("entry CRANKING in " + snapshot()); })
                        .whenExited([&] { log.push_back("exit CRANKING in " + snapshot()); })
                        .build();
    auto running = builder.addState()
                       .named("RUNNING")
                       .whenEntered([&] { log.push_back("entry RUNNING in " + snapshot()); })
                       .build();

    builder.addTransition()
        .from(off)
        .to(cranking)
        .on<std::string>()
        .check(state::Guards::equals("start"))
        .execute([&](const std::string &) { log.push_back("action start in " + snapshot()); })
        .build();
    builder.addTransition()
        .from(cranking)
        .to(running)
        .on<Started>()
        .execute([&](const Started &) { log.push_back("action started in " + snapshot()); })
        .build();
    builder.addTransition()
        .from(running)
        .to(off)
        .on<std::string>()
        .check(state::Guards::equals("stop"))
        .build();

    auto automaton = builder.initialState(off).build();
    engine = automaton.get();
    automaton->enable();
    log.clear();

    automaton->post("start");
    std::vector<std::string> cranked{"exit OFF in OFF", "action start in <undefined>", "entry CRANKING in CRANKING"};
    CHECK(log == cranked);
    CHECK(automaton->currentState() == cranking);

    log.clear();
    automaton->post("stop"); // nothing leaves CRANKING on "stop"
    CHECK(log.empty());
    CHECK(automaton->currentState() == cranking);

    automaton->post(Started::Yes);
    std::vector<std::string> started{"exit CRANKING in CRANKING", "action started in <undefined>",
                                     "entry RUNNING in RUNNING"};
    CHECK(log == started);

    log.clear();
    automaton->post("stop");
    std::vector<std::string> stopped{"entry OFF in OFF"};
    CHECK(log == stopped);
    CHECK(automaton->currentState() == off);
}

TEST_CASE("Automaton: Unmatched events are discarded") {
    int actions = 0;
    state::Builder builder;
    auto a = builder.addState().whenExited([&actions] { ++actions; }).build();
    auto b = builder.addState().whenEntered([&actions] { ++actions; }).build();
    builder.addTransition().from(a).to(b).on<int>().execute([&actions](const int &) { ++actions; }).build();
    builder.addTransition().from(b).to(a).on<std::string>().build();
    auto automaton = builder.initialState(a).build();
    automaton->enable();

    automaton->post(3.5);
    automaton->post("from b only");
    CHECK(automaton->currentState() == a);
    CHECK(actions == 0);
}

TEST_CASE("Automaton: Transition sources must match the current state") {
    std::vector<std::string> log;
    state::Builder builder;
    auto a = builder.addState().named("a").build();
    auto b = builder.addState().named("b").build();
    auto c = builder.addState().named("c").build();
    builder.addTransition().from(b).to(c).execute([&log](const state::Event &) { log.push_back("b->c"); }).build();
    builder.addTransition().from(a).to(b).execute([&log](const state::Event &) { log.push_back("a->b"); }).build();
    auto automaton = builder.initialState(a).build();
    automaton->enable();

    // One transition per event even though b->c would match right after a->b
    automaton->post(1);
    std::vector<std::string> expected{"a->b"};
    CHECK(log == expected);
    CHECK(automaton->currentState() == b);

    automaton->post(2);
    CHECK(automaton->currentState() == c);
}

TEST_CASE("Automaton: Actions may post further events") {
    std::vector<std::string> log;
    state::Automaton *self = nullptr;
    state::Builder builder;
    auto a = builder.addState().named("a").build();
    auto b = builder.addState().named("b").whenEntered([&log] { log.push_back("entry b"); }).build();
    builder.addTransition()
        .from(a)
        .to(a)
        .on<std::string>()
        .check(state::Guards::equals("bounce"))
        .execute([&](const std::string &) { self->post(1); })
        .build();
    builder.addTransition().from(a).to(b).on<int>().build();
    auto automaton = builder.initialState(a).build();
    self = automaton.get();
    automaton->enable();

    automaton->post("bounce");
    CHECK(automaton->currentState() == b);
    std::vector<std::string> expected{"entry b"};
    CHECK(log == expected);
}

TEST_CASE("Automaton: Exceptions from actions reach the caller under the inline executor") {
    state::Builder builder;
    auto a = builder.addState().build();
    builder.addTransition()
        .from(a)
        .to(a)
        .execute([](const state::Event &) { throw std::runtime_error("action failed"); })
        .build();
    auto automaton = builder.initialState(a).build();
    automaton->enable();

    CHECK_THROWS_WITH_AS(automaton->post(1), "action failed", std::runtime_error);
    CHECK(automaton->currentState() == a);
}
