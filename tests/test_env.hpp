#pragma once

// Test-only environment setter shim.
// Configuration tests call _putenv("NAME=VALUE"); on non-Windows test_env.cpp defines it.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

#include <string>

// Sets NAME=VALUE for the lifetime of the guard and restores the previous value afterwards.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string previous_;
    bool had_previous_ = false;
};
