// Single state, one self-transition: any non-empty line typed on the console
// is answered with "Hello, <line>!".
#include <sprout/sprout.hpp>
#include <iostream>
#include <string>

using namespace sprout;

int main() {
    state::Builder builder;

    // This automaton has only a single state
    auto greeting = builder.addState().named("greeting").build();

    builder.addTransition()
        .from(greeting)
        .to(greeting)
        .on<std::string>()
        .check([](const std::string &name) { return !name.empty(); })
        .execute([](const std::string &name) { std::cout << "Hello, " << name << "!" << std::endl; })
        .build();

    auto automaton = builder.initialState(greeting).build();
    automaton->enable();

    std::string line;
    while (std::getline(std::cin, line)) {
        automaton->post(line);
    }
    return 0;
}
