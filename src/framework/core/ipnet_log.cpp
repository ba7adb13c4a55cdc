#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <string_view>
#include <strings.h>

#include "core/ipnet_log.h"

namespace ipnet::log {

static std::atomic<ipnet_log_level> log_level{IPNET_LOG_INFO};

constexpr static std::array<std::string_view, IPNET_LOG_MAX> level_names = {
    "none", "critical", "error", "warning", "info", "debug", "trace"};

/* Fixed width tags for aligned output */
constexpr static std::array<std::string_view, IPNET_LOG_MAX> level_tags = {
    "", "CRIT ", "ERROR", "WARN ", "INFO ", "DEBUG", "TRACE"};

static bool valid_level(int level)
{
    return (level > IPNET_LOG_NONE && level < IPNET_LOG_MAX);
}

static std::string timestamp()
{
    using namespace std::chrono;

    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto msecs =
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    struct tm utc;
    gmtime_r(&secs, &utc);

    auto buffer = std::array<char, 32>{};
    auto length = strftime(buffer.data(), buffer.size(), "%FT%T", &utc);
    snprintf(buffer.data() + length,
             buffer.size() - length,
             ".%03dZ",
             static_cast<int>(msecs));

    return (std::string(buffer.data()));
}

} // namespace ipnet::log

extern "C" {

enum ipnet_log_level ipnet_log_level_get(void)
{
    return (ipnet::log::log_level.load(std::memory_order_relaxed));
}

void ipnet_log_level_set(enum ipnet_log_level level)
{
    ipnet::log::log_level.store(level, std::memory_order_relaxed);
}

enum ipnet_log_level parse_log_optarg(const char* arg)
{
    if (!arg) { return (IPNET_LOG_NONE); }

    /* Numeric level? */
    char* end = nullptr;
    errno = 0;
    auto value = strtol(arg, &end, 10);
    if (errno == 0 && end != arg && *end == '\0') {
        return (ipnet::log::valid_level(value)
                    ? static_cast<ipnet_log_level>(value)
                    : IPNET_LOG_NONE);
    }

    for (int level = IPNET_LOG_CRITICAL; level < IPNET_LOG_MAX; level++) {
        if (strcasecmp(arg, ipnet::log::level_names[level].data()) == 0) {
            return (static_cast<ipnet_log_level>(level));
        }
    }

    return (IPNET_LOG_NONE);
}

enum ipnet_log_level ipnet_log_level_find(int argc, char* const argv[])
{
    for (int idx = 1; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--log-level") == 0
            || strcmp(argv[idx], "-L") == 0) {
            return (parse_log_optarg(argv[idx + 1]));
        }
    }

    return (IPNET_LOG_NONE);
}

/*
 * The function name ends at the first parenthesis outside of any template
 * argument list and starts after the last space before it, again ignoring
 * spaces inside template argument lists.
 */
void ipnet_log_function_name(const char* signature, char* function)
{
    auto input = std::string_view(signature);

    auto depth = 0;
    auto end = input.size();
    for (size_t idx = 0; idx < input.size(); idx++) {
        auto c = input[idx];
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (c == '(' && depth == 0) {
            end = idx;
            break;
        }
    }

    depth = 0;
    auto start = end;
    while (start > 0) {
        auto c = input[start - 1];
        if (c == '>') {
            depth++;
        } else if (c == '<') {
            depth--;
        } else if (c == ' ' && depth == 0) {
            break;
        }
        start--;
    }

    auto name = input.substr(start, end - start);
    memcpy(function, name.data(), name.size());
    function[name.size()] = '\0';
}

int ipnet_vlog(enum ipnet_log_level level,
               const char* tag,
               const char* format,
               va_list argp)
{
    if (!ipnet::log::valid_level(level)) { return (-EINVAL); }

    auto message = std::array<char, 1024>{};
    vsnprintf(message.data(), message.size(), format, argp);

    /* Write the line with a single call so lines don't interleave */
    auto line = ipnet::log::timestamp() + " "
                + std::string(ipnet::log::level_tags[level]) + " [" + tag
                + "] " + message.data();
    if (fputs(line.c_str(), stderr) == EOF) { return (-EIO); }

    return (0);
}

int ipnet_log(enum ipnet_log_level level, const char* tag, const char* format,
              ...)
{
    va_list argp;
    va_start(argp, format);
    auto error = ipnet_vlog(level, tag, format, argp);
    va_end(argp);

    return (error);
}
}
