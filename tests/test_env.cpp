// POSIX shim for _putenv("NAME=VALUE") plus a scoped setter for configuration tests.

#include "test_env.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if (!assignment) return -1;
    const char* eq = std::strchr(assignment, '=');
    if (!eq) {
        // Not in NAME=VALUE form
        return -1;
    }
    std::string name(assignment, static_cast<size_t>(eq - assignment));
    const char* value = eq + 1;
    if (!*value) {
        // Unset when empty after '='
        return ::unsetenv(name.c_str());
    }
    return ::setenv(name.c_str(), value, 1);
}
#endif

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name)
{
    if (const char* old = std::getenv(name)) {
        had_previous_ = true;
        previous_ = old;
    }
    std::string assignment = name_ + "=" + (value ? value : "");
    _putenv(assignment.c_str());
}

ScopedEnv::~ScopedEnv()
{
    std::string assignment = name_ + "=" + (had_previous_ ? previous_ : std::string());
    _putenv(assignment.c_str());
}
