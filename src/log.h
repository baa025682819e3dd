#pragma once

#include "prelude.hpp"

enum class LogLevel
{
    Quiet,
    Error,
    Warn,
    Info,
    Debug
};

struct Log
{
    static void set_level(LogLevel level);
    static LogLevel level();

    static void error(const char* format, ...) __attribute__((format(printf, 1, 2)));
    static void warn(const char* format, ...) __attribute__((format(printf, 1, 2)));
    static void info(const char* format, ...) __attribute__((format(printf, 1, 2)));
    static void debug(const char* format, ...) __attribute__((format(printf, 1, 2)));
};
