#pragma once

// Core structures
#include "event.hpp"
#include "structure/state.hpp"
#include "structure/transition.hpp"

// Automaton and builder
#include "builder.hpp"
#include "machine.hpp"
