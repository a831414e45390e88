#pragma once
#include <string>

// Test-only environment helpers.
// _putenv("NAME=VALUE") is native on Windows; test_env.cpp maps it to
// setenv/unsetenv elsewhere. An empty value unsets the variable.
#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

// Sets NAME=VALUE for the lifetime of the object, then restores the previous value.
class scoped_env {
public:
    scoped_env(const char* name, const char* value);
    ~scoped_env();
    scoped_env(const scoped_env&) = delete;
    scoped_env& operator=(const scoped_env&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_;
};
