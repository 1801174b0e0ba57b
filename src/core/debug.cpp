#include "diagramsim/core/debug.hpp"

int Debug::currentLevel = DEBUG_LEVEL_WARNING;
