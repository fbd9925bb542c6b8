#pragma once

#include <stdint.h>

// Contract: logger is intended for the single cooperative loop thread (not signal-safe).

namespace farmlink
{

// Logging levels
enum class LogLevel : uint8_t
{
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

// Logging domains
enum class LogDomain : uint8_t
{
    SYSTEM = 0,
    STORE,
    AUTH,
    DEVICE,
    SCHEDULE,
    EVENTS,
    CONFIG,
    SIM
};

void logger_begin(bool stderrEnabled = true, bool colorEnabled = true);
void logger_setColorEnabled(bool enabled);
void logger_setHighFreqEnabled(bool enabled);
bool logger_isHighFreqEnabled();

// Optional mirror of every formatted line (level/domain/message), e.g. for capture in tests.
using LoggerSinkFn = void (*)(LogLevel lvl, LogDomain dom, const char *msg, void *user);
void logger_setSink(LoggerSinkFn sinkFn, void *user = nullptr);

const char *logger_levelName(LogLevel lvl);
const char *logger_domainName(LogDomain dom);

void logger_log(LogLevel lvl, LogDomain dom, const char *fmt, ...) __attribute__((format(printf, 3, 4)));
void logger_logEvery(const char *key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char *fmt, ...)
    __attribute__((format(printf, 5, 6)));

} // namespace farmlink

#define FARMLINK_LOG_DEBUG(dom, fmt, ...) ::farmlink::logger_log(::farmlink::LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_INFO(dom, fmt, ...) ::farmlink::logger_log(::farmlink::LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_WARN(dom, fmt, ...) ::farmlink::logger_log(::farmlink::LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_ERROR(dom, fmt, ...) ::farmlink::logger_log(::farmlink::LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)

#define FARMLINK_LOG_DEBUG_EVERY(key, intervalMs, dom, fmt, ...) \
    ::farmlink::logger_logEvery(key, intervalMs, ::farmlink::LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_INFO_EVERY(key, intervalMs, dom, fmt, ...) \
    ::farmlink::logger_logEvery(key, intervalMs, ::farmlink::LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_WARN_EVERY(key, intervalMs, dom, fmt, ...) \
    ::farmlink::logger_logEvery(key, intervalMs, ::farmlink::LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define FARMLINK_LOG_ERROR_EVERY(key, intervalMs, dom, fmt, ...) \
    ::farmlink::logger_logEvery(key, intervalMs, ::farmlink::LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)
