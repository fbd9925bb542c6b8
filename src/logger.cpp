#include "farmlink/logger.h"

#include <chrono>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "farmlink/config.h"

namespace farmlink
{

static bool s_stderrEnabled = true;
static bool s_colorEnabled = FARMLINK_CFG_LOG_COLOR != 0;
static bool s_highFreqEnabled = FARMLINK_CFG_LOG_HIGH_FREQ_DEFAULT != 0;
static LoggerSinkFn s_sink = nullptr;
static void *s_sinkUser = nullptr;

static constexpr size_t kThrottleSlots = 16;
static constexpr size_t kKeyTagLen = 12;
static constexpr size_t kMsgBufSize = 256;
static constexpr const char *kAnsiReset = "\x1B[0m";
static constexpr const char *kAnsiDimGray = "\x1B[2m\x1B[90m";

struct ThrottleEntry
{
    uint32_t hash = 0;
    uint64_t lastMs = 0;
    char keyTag[kKeyTagLen] = {0};
};
static ThrottleEntry s_throttle[kThrottleSlots] = {};

static uint64_t uptimeMs()
{
    static const std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - s_start).count());
}

static uint32_t fnv1a32(const char *s)
{
    if (!s)
        return 0;
    uint32_t hash = 2166136261u;
    for (const uint8_t *p = (const uint8_t *)s; *p; ++p)
    {
        hash ^= *p;
        hash *= 16777619u;
    }
    return hash == 0 ? 1u : hash;
}

static void makeKeyTag(const char *key, char *outTag, size_t tagLen)
{
    if (!outTag || tagLen == 0)
        return;
    if (!key)
    {
        outTag[0] = '\0';
        return;
    }
    strncpy(outTag, key, tagLen - 1);
    outTag[tagLen - 1] = '\0';
}

const char *logger_levelName(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    default:
        return "UNK";
    }
}

const char *logger_domainName(LogDomain dom)
{
    switch (dom)
    {
    case LogDomain::SYSTEM:
        return "SYSTEM";
    case LogDomain::STORE:
        return "STORE";
    case LogDomain::AUTH:
        return "AUTH";
    case LogDomain::DEVICE:
        return "DEVICE";
    case LogDomain::SCHEDULE:
        return "SCHEDULE";
    case LogDomain::EVENTS:
        return "EVENTS";
    case LogDomain::CONFIG:
        return "CONFIG";
    case LogDomain::SIM:
        return "SIM";
    default:
        return "UNK";
    }
}

static const char *levelToStyle(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::ERROR:
        return "\x1B[1m\x1B[31m";
    case LogLevel::WARN:
        return "\x1B[1m\x1B[33m";
    case LogLevel::INFO:
        return "";
    case LogLevel::DEBUG:
        return "\x1B[2m\x1B[36m";
    default:
        return kAnsiDimGray;
    }
}

static const char *domainToAnsiColor(LogDomain dom)
{
    switch (dom)
    {
    case LogDomain::STORE:
        return "\x1B[35m";
    case LogDomain::AUTH:
        return "\x1B[34m";
    case LogDomain::DEVICE:
        return "\x1B[32m";
    case LogDomain::SCHEDULE:
        return "\x1B[2m\x1B[33m";
    case LogDomain::EVENTS:
        return "\x1B[36m";
    case LogDomain::CONFIG:
        return "\x1B[36m";
    case LogDomain::SIM:
        return "\x1B[2m\x1B[32m";
    case LogDomain::SYSTEM:
    default:
        return kAnsiDimGray;
    }
}

static void appendTruncMarker(char *buf, size_t bufSize)
{
    if (!buf || bufSize < 4)
        return;
    const size_t end = bufSize - 1;
    buf[end - 3] = '.';
    buf[end - 2] = '.';
    buf[end - 1] = '.';
    buf[end] = '\0';
}

static void logToStderr(uint64_t tsMs, LogLevel lvl, LogDomain dom, const char *msg)
{
    if (!s_stderrEnabled)
        return;

    char tsBuf[24];
    snprintf(tsBuf, sizeof(tsBuf), "[%6lu]", (unsigned long)(tsMs / 1000));

    if (s_colorEnabled)
    {
        fprintf(stderr, "%s%s%s %s%-7.7s%s %s%-8.8s%s: %s\n",
                kAnsiDimGray, tsBuf, kAnsiReset,
                levelToStyle(lvl), logger_levelName(lvl), kAnsiReset,
                domainToAnsiColor(dom), logger_domainName(dom), kAnsiReset,
                msg ? msg : "");
    }
    else
    {
        fprintf(stderr, "%s %-7.7s %-8.8s: %s\n", tsBuf, logger_levelName(lvl), logger_domainName(dom), msg ? msg : "");
    }
}

static void emit(uint64_t tsMs, LogLevel lvl, LogDomain dom, const char *msg)
{
    logToStderr(tsMs, lvl, dom, msg);
    if (s_sink)
    {
        s_sink(lvl, dom, msg, s_sinkUser);
    }
}

void logger_begin(bool stderrEnabled, bool colorEnabled)
{
    s_stderrEnabled = stderrEnabled;
    s_colorEnabled = colorEnabled;
    uptimeMs();
}

void logger_setColorEnabled(bool enabled)
{
    s_colorEnabled = enabled;
}

void logger_setSink(LoggerSinkFn sinkFn, void *user)
{
    s_sink = sinkFn;
    s_sinkUser = user;
}

void logger_setHighFreqEnabled(bool enabled)
{
    if (s_highFreqEnabled == enabled)
    {
        return;
    }
    s_highFreqEnabled = enabled;
    logger_log(LogLevel::INFO, LogDomain::SYSTEM, "High-frequency logging %s", enabled ? "enabled" : "disabled");
}

bool logger_isHighFreqEnabled()
{
    return s_highFreqEnabled;
}

void logger_log(LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    char msgBuf[kMsgBufSize];
    va_list args;
    va_start(args, fmt);
    const int needed = vsnprintf(msgBuf, sizeof(msgBuf), fmt, args);
    va_end(args);
    if (needed < 0)
    {
        msgBuf[0] = '\0';
    }
    else if ((size_t)needed >= sizeof(msgBuf))
    {
        appendTruncMarker(msgBuf, sizeof(msgBuf));
    }

    emit(uptimeMs(), lvl, dom, msgBuf);
}

void logger_logEvery(const char *key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    if (!s_highFreqEnabled)
    {
        return;
    }

    const uint64_t now = uptimeMs();
    const uint32_t keyHash = fnv1a32(key);
    char keyTag[kKeyTagLen];
    makeKeyTag(key, keyTag, sizeof(keyTag));

    if (key && key[0] != '\0' && intervalMs > 0)
    {
        ThrottleEntry *slot = nullptr;
        ThrottleEntry *oldest = nullptr;
        uint64_t oldestAge = 0;
        for (size_t i = 0; i < kThrottleSlots; ++i)
        {
            ThrottleEntry &e = s_throttle[i];
            if (e.hash == keyHash && strncmp(e.keyTag, keyTag, sizeof(e.keyTag)) == 0)
            {
                slot = &e;
                break;
            }
            if (e.hash == 0 && slot == nullptr)
            {
                slot = &e;
            }
            if (e.hash != 0)
            {
                const uint64_t age = now - e.lastMs;
                if (!oldest || age > oldestAge)
                {
                    oldest = &e;
                    oldestAge = age;
                }
            }
        }

        if (slot == nullptr)
        {
            slot = oldest ? oldest : &s_throttle[0];
        }

        if (slot->hash == keyHash && strncmp(slot->keyTag, keyTag, sizeof(slot->keyTag)) == 0)
        {
            if (now - slot->lastMs < intervalMs)
            {
                return;
            }
        }

        slot->hash = keyHash;
        makeKeyTag(key, slot->keyTag, sizeof(slot->keyTag));
        slot->lastMs = now;
    }

    char msgBuf[kMsgBufSize];
    va_list args;
    va_start(args, fmt);
    const int needed = vsnprintf(msgBuf, sizeof(msgBuf), fmt, args);
    va_end(args);
    if (needed < 0)
    {
        msgBuf[0] = '\0';
    }
    else if ((size_t)needed >= sizeof(msgBuf))
    {
        appendTruncMarker(msgBuf, sizeof(msgBuf));
    }

    emit(now, lvl, dom, msgBuf);
}

} // namespace farmlink
