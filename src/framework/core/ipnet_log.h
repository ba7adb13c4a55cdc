#ifndef _IPNET_LOG_H_
#define _IPNET_LOG_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stdint.h>
#include <string.h>

enum ipnet_log_level {
    IPNET_LOG_NONE = 0,
    IPNET_LOG_CRITICAL, /**< Fatal error condition */
    IPNET_LOG_ERROR,    /**< Non-fatal error condition */
    IPNET_LOG_WARNING,  /**< Unexpected event or condition */
    IPNET_LOG_INFO,     /**< Informational messages */
    IPNET_LOG_DEBUG,    /**< Debugging messages */
    IPNET_LOG_TRACE,    /**< Trace level messages */
    IPNET_LOG_MAX,
};

/**
 * Get the application log level
 *
 * @return
 *   The current system log level
 */
enum ipnet_log_level ipnet_log_level_get(void);

/**
 * Set the application log level
 *
 * @param level
 *   A value between IPNET_LOG_CRITICAL (1) and IPNET_LOG_TRACE (6)
 */
void ipnet_log_level_set(enum ipnet_log_level level);

/**
 * Retrieve the log level from the command line
 *
 * @param[in] argc
 *   The number of cli arguments
 * @param[in] argv
 *   Array of cli strings
 *
 * @return
 *   log level found in cli arguments (may be IPNET_LOG_NONE)
 */
enum ipnet_log_level ipnet_log_level_find(int argc, char* const argv[]);

/**
 * Parse a log level argument, either a name or a number, to the
 * associated enum value.
 *
 * @return
 *   log level found in arg, IPNET_LOG_NONE otherwise
 */
enum ipnet_log_level parse_log_optarg(const char* arg);

/**
 * Get the full function name from the full function signature string
 *
 * @param[in] signature
 *   The full function signature
 * @param[out] function
 *   Buffer for function name; should be at least as long as signature
 */
void ipnet_log_function_name(const char* signature, char* function);

/**
 * Macro to possibly write a message to the log.
 * Logging arguments are not evaluated unless the message is written.
 *
 * @param level
 *   The level of the message
 * @param format
 *   The printf format string, followed by variable arguments
 */
#define IPNET_LOG(level, format, ...)                                          \
    do {                                                                       \
        if (level <= ipnet_log_level_get()) {                                  \
            char function_[sizeof(__PRETTY_FUNCTION__)];                       \
            ipnet_log_function_name(__PRETTY_FUNCTION__, function_);           \
            ipnet_log(level, function_, format, ##__VA_ARGS__);                \
        }                                                                      \
    } while (0)

/**
 * Write a message to the log
 *
 * @param level
 *   The level of the message
 * @param tag
 *   Additional information to add to message
 * @param format
 *   The printf format string, followed by variable arguments
 * @return
 *   -  0: Success
 *   - !0: Error
 */
int ipnet_log(enum ipnet_log_level level, const char* tag, const char* format,
              ...) __attribute__((format(printf, 3, 4)));

int ipnet_vlog(enum ipnet_log_level level,
               const char* tag,
               const char* format,
               va_list argp);

#ifdef __cplusplus
}
#endif

#endif /* _IPNET_LOG_H_ */
