#include "log.h"

namespace {

LogLevel current_level = LogLevel::Info;

void write_line(const LogLevel level, const char* tag, const char* format, va_list args)
{
    if (static_cast<int>(level) > static_cast<int>(current_level))
    {
        return;
    }
    std::fprintf(stderr, "baketm: %s", tag);
    std::vfprintf(stderr, format, args);
    std::fputc('\n', stderr);
}

} // namespace

void Log::set_level(const LogLevel level)
{
    current_level = level;
}

LogLevel Log::level()
{
    return current_level;
}

void Log::error(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Error, "error: ", format, args);
    va_end(args);
}

void Log::warn(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Warn, "warning: ", format, args);
    va_end(args);
}

void Log::info(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Info, "", format, args);
    va_end(args);
}

void Log::debug(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Debug, "debug: ", format, args);
    va_end(args);
}
