// Two-state light bulb controlled from the console: "on" switches it on while
// off, "off" switches it off while on. Anything else is ignored.
#include <sprout/sprout.hpp>
#include <iostream>
#include <string>

using namespace sprout;

int main() {
    state::Builder builder;

    auto off = builder.addState()
                   .named("off")
                   .whenEntered([] { std::cout << "💡 The light bulb has been turned off!" << std::endl; })
                   .build();

    auto on = builder.addState()
                  .named("on")
                  .whenEntered([] { std::cout << "💡 The light bulb has been turned on!" << std::endl; })
                  .build();

    builder.addTransition().from(off).to(on).check(state::Guards::equals("on")).build();
    builder.addTransition().from(on).to(off).check(state::Guards::equals("off")).build();

    auto automaton = builder.initialState(off).build();
    automaton->enable();

    std::string line;
    while (std::getline(std::cin, line)) {
        automaton->post(line);
    }
    return 0;
}
