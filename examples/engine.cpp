// Engine with three states. Typing "start" cranks the engine, which takes a
// couple of seconds; a background thread then posts Started. "stop" turns a
// running engine off. Events arrive from two threads, so the automaton runs on
// a SerialExecutor.
#include <sprout/sprout.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace sprout;
using namespace std::chrono_literals;

enum class EngineEvent { Started };

int main() {
    auto executor = std::make_shared<core::SerialExecutor>(core::SerialExecutor::Options{0, "engine"});
    std::vector<std::thread> crankers;
    state::Automaton *engine = nullptr;

    state::Builder builder;
    auto off = builder.addState().named("OFF").build();
    auto cranking = builder.addState()
                        .named("CRANKING")
                        .whenExited([] { std::cout << "Cranking done." << std::endl; })
                        .build();
    auto running = builder.addState().named("RUNNING").build();

    builder.addTransition()
        .from(off)
        .to(cranking)
        .on<std::string>()
        .check(state::Guards::equals("start"))
        .execute([&](const std::string &) {
            std::cout << "Turning engine on..." << std::endl;
            crankers.emplace_back([&engine] {
                std::this_thread::sleep_for(2500ms);
                engine->post(EngineEvent::Started);
            });
        })
        .build();

    builder.addTransition()
        .from(cranking)
        .to(running)
        .on<EngineEvent>()
        .check(state::Guards::equals(EngineEvent::Started))
        .execute([](EngineEvent) { std::cout << "Engine is now running!" << std::endl; })
        .build();

    builder.addTransition()
        .from(running)
        .to(off)
        .on<std::string>()
        .check(state::Guards::equals("stop"))
        .execute([](const std::string &) { std::cout << "Engine stopped!" << std::endl; })
        .build();

    auto automaton = builder.initialState(off).executor(executor).build();
    engine = automaton.get();
    automaton->enable();

    std::string line;
    while (std::getline(std::cin, line)) {
        automaton->post(line);
    }

    executor->drain();
    for (auto &cranker : crankers) {
        cranker.join();
    }
    executor->drain();
    return 0;
}
