#pragma once

#include <string_view>

#include <fmt/format.h>

#define LOG_IMPL(type, func, str)       os::logger::Log(str, ELogType::type, func)
#define LOGF_IMPL(type, func, str, ...) os::logger::Log(fmt::format(str, ##__VA_ARGS__), ELogType::type, func)

// Function-specific logging.

#define LOG(str)         LOG_IMPL(None, __func__, str)
#define LOG_STEP(str)    LOG_IMPL(Step, __func__, str)
#define LOG_SUCCESS(str) LOG_IMPL(Success, __func__, str)
#define LOG_WARNING(str) LOG_IMPL(Warning, __func__, str)
#define LOG_ERROR(str)   LOG_IMPL(Error, __func__, str)
#define LOG_UTILITY(str) LOG_IMPL(Utility, __func__, str)

#define LOGF(str, ...)         LOGF_IMPL(None, __func__, str, ##__VA_ARGS__)
#define LOGF_STEP(str, ...)    LOGF_IMPL(Step, __func__, str, ##__VA_ARGS__)
#define LOGF_SUCCESS(str, ...) LOGF_IMPL(Success, __func__, str, ##__VA_ARGS__)
#define LOGF_WARNING(str, ...) LOGF_IMPL(Warning, __func__, str, ##__VA_ARGS__)
#define LOGF_ERROR(str, ...)   LOGF_IMPL(Error, __func__, str, ##__VA_ARGS__)
#define LOGF_UTILITY(str, ...) LOGF_IMPL(Utility, __func__, str, ##__VA_ARGS__)

// Non-function-specific logging.

#define LOGN(str)         LOG_IMPL(None, nullptr, str)
#define LOGN_STEP(str)    LOG_IMPL(Step, nullptr, str)
#define LOGN_SUCCESS(str) LOG_IMPL(Success, nullptr, str)
#define LOGN_WARNING(str) LOG_IMPL(Warning, nullptr, str)
#define LOGN_ERROR(str)   LOG_IMPL(Error, nullptr, str)
#define LOGN_UTILITY(str) LOG_IMPL(Utility, nullptr, str)

#define LOGFN(str, ...)         LOGF_IMPL(None, nullptr, str, ##__VA_ARGS__)
#define LOGFN_STEP(str, ...)    LOGF_IMPL(Step, nullptr, str, ##__VA_ARGS__)
#define LOGFN_SUCCESS(str, ...) LOGF_IMPL(Success, nullptr, str, ##__VA_ARGS__)
#define LOGFN_WARNING(str, ...) LOGF_IMPL(Warning, nullptr, str, ##__VA_ARGS__)
#define LOGFN_ERROR(str, ...)   LOGF_IMPL(Error, nullptr, str, ##__VA_ARGS__)
#define LOGFN_UTILITY(str, ...) LOGF_IMPL(Utility, nullptr, str, ##__VA_ARGS__)

enum class ELogType
{
    None,
    Step,
    Success,
    Warning,
    Error,
    ErrorDetail,
    Utility
};

namespace os::logger
{
    /**
     * Decide whether colors are used. Colors are only ever emitted
     * when the target stream is a terminal and NO_COLOR is not set.
     */
    void Init(bool colorRequested, bool verbose);

    /**
     * Error and ErrorDetail lines go to stderr, everything else to stdout.
     * Utility lines are dropped unless verbose logging is enabled.
     */
    void Log(std::string_view str, ELogType type = ELogType::None, const char* func = nullptr);
}
