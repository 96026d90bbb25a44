#pragma once

// Runtime support
#include "core/error.hpp"
#include "core/executor.hpp"
#include "core/log.hpp"

// Automaton
#include "state/state.hpp"
