#pragma once

#include <iostream>

// Set to 0 to compile out all log output
#ifndef DIAGRAMSIM_ENABLE_DEBUG
#define DIAGRAMSIM_ENABLE_DEBUG 1
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_WARNING 1
#define DEBUG_LEVEL_INFO 2
#define DEBUG_LEVEL_VERBOSE 3

// Log macro: DIAGRAMSIM_LOG(DEBUG_LEVEL_WARNING, "x=" << x << "\n")
#define DIAGRAMSIM_LOG(lvl, x) do { \
    if (DIAGRAMSIM_ENABLE_DEBUG && (lvl) <= ::Debug::level()) { \
        std::cerr << ::Debug::prefix(lvl) << x; \
    } \
} while(0)

#define DIAGRAMSIM_WARN(x) DIAGRAMSIM_LOG(DEBUG_LEVEL_WARNING, x << "\n")
#define DIAGRAMSIM_INFO(x) DIAGRAMSIM_LOG(DEBUG_LEVEL_INFO, x << "\n")
#define DIAGRAMSIM_VERBOSE(x) DIAGRAMSIM_LOG(DEBUG_LEVEL_VERBOSE, x << "\n")

// Runtime log level shared by the macros above
class Debug {
public:
    static int level() { return currentLevel; }
    static void setLevel(int lvl) { currentLevel = lvl; }

    static const char* prefix(int lvl) {
        switch (lvl) {
            case DEBUG_LEVEL_WARNING: return "[diagramsim] warning: ";
            case DEBUG_LEVEL_INFO:    return "[diagramsim] ";
            default:                  return "[diagramsim] debug: ";
        }
    }

private:
    static int currentLevel;
};
