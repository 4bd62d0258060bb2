#include "logger.h"

#include <cstdio>
#include <cstdlib>

#include <fmt/color.h>
#include <unistd.h>

static bool g_colorStdout = false;
static bool g_colorStderr = false;
static bool g_verbose = false;

static fmt::text_style GetStyle(ELogType type)
{
    switch (type)
    {
    case ELogType::Step:
        return fmt::fg(fmt::terminal_color::bright_yellow);
    case ELogType::Success:
        return fmt::fg(fmt::terminal_color::green);
    case ELogType::Warning:
        return fmt::fg(fmt::terminal_color::yellow);
    case ELogType::Error:
        return fmt::fg(fmt::terminal_color::red);
    case ELogType::Utility:
        return fmt::fg(fmt::terminal_color::cyan);
    default:
        return {};
    }
}

void os::logger::Init(bool colorRequested, bool verbose)
{
    const char* noColor = std::getenv("NO_COLOR");
    bool colorAllowed = colorRequested && (noColor == nullptr || noColor[0] == '\0');

    g_colorStdout = colorAllowed && isatty(fileno(stdout));
    g_colorStderr = colorAllowed && isatty(fileno(stderr));
    g_verbose = verbose;
}

void os::logger::Log(std::string_view str, ELogType type, const char* func)
{
    if (type == ELogType::Utility && !g_verbose)
        return;

    bool toStderr = type == ELogType::Error || type == ELogType::ErrorDetail;
    FILE* stream = toStderr ? stderr : stdout;
    bool useColor = toStderr ? g_colorStderr : g_colorStdout;

    std::string line = func ? fmt::format("[{}] {}", func, str) : std::string(str);

    if (useColor && type != ELogType::None && type != ELogType::ErrorDetail)
        fmt::print(stream, GetStyle(type), "{}", line);
    else
        fmt::print(stream, "{}", line);

    fmt::print(stream, "\n");

    // Keep stdout and stderr ordered when both point at the same terminal.
    std::fflush(stream);
}
