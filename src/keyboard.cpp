#include "keyboard.h"
#include "log.h"

#include <fcntl.h>
#include <unistd.h>

KeyboardMode::KeyboardMode()
{
    if (!isatty(STDIN_FILENO))
    {
        Log::debug("stdin is not a terminal, keyboard input disabled");
        return;
    }

    termios current{};
    if (tcgetattr(STDIN_FILENO, &current) != 0)
    {
        Log::warn("cannot read terminal attributes: %s", std::strerror(errno));
        return;
    }

    termios raw = current;
    raw.c_lflag &= ~(ECHO | ECHONL | ICANON);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0)
    {
        Log::warn("cannot switch terminal to raw input: %s", std::strerror(errno));
        return;
    }
    saved_termios_ = current;

    saved_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    if (saved_flags_ >= 0 && fcntl(STDIN_FILENO, F_SETFL, saved_flags_ | O_NONBLOCK) != 0)
    {
        Log::warn("cannot make stdin non-blocking: %s", std::strerror(errno));
    }
}

KeyboardMode::~KeyboardMode()
{
    if (!saved_termios_)
    {
        return;
    }
    if (saved_flags_ >= 0)
    {
        (void)fcntl(STDIN_FILENO, F_SETFL, saved_flags_);
    }
    (void)tcsetattr(STDIN_FILENO, TCSANOW, &*saved_termios_);
}

auto KeyboardMode::drain_into(std::string& buffer) const -> size_t
{
    if (!active())
    {
        return 0;
    }

    size_t total = 0;
    char chunk[64];
    for (;;)
    {
        const ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n > 0)
        {
            buffer.append(chunk, static_cast<size_t>(n));
            total += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
        {
            Log::debug("stdin read failed: %s", std::strerror(errno));
        }
        return total;
    }
}
