#include "farmlink/console.h"

#include <ctype.h>
#include <stdint.h>
#include <string.h>

#include "farmlink/config.h"
#include "farmlink/domain_strings.h"
#include "farmlink/logger.h"
#include "farmlink/sensor_status.h"
#include "farmlink/time_format.h"

namespace farmlink
{

static constexpr const char *kConsoleDelims = " \t";

const char *consoleResultName(ConsoleResult result)
{
    switch (result)
    {
    case ConsoleResult::EMPTY:
        return "empty";
    case ConsoleResult::OK:
        return "ok";
    case ConsoleResult::REFUSED:
        return "refused";
    case ConsoleResult::USAGE:
        return "usage";
    case ConsoleResult::UNKNOWN:
        return "unknown";
    case ConsoleResult::QUIT:
        return "quit";
    default:
        return "?";
    }
}

void console_printHelp()
{
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "[CONSOLE] commands:");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  status   -> session phase, sensors, controls, schedule");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  sensors  -> latest sensor snapshot with feed/ammonia status");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  controls -> last known actuator states");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  schedule -> committed schedule and unsaved draft");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  toggle <fan|heater|led> -> flip a persistent device");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  pulse <feed|stepper1|stepper2> -> run a momentary device");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  set <egg_time|stool_time|feed_time|led_on|led_off> <HH:MM> -> edit draft");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  save     -> write the schedule draft");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  log      -> show the event log (newest first)");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  clear    -> clear the event log");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  auth     -> retry anonymous sign-in");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  sim <normal|malformed|silent> -> controller simulation mode");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  offline / online -> fail or accept store writes");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  writes   -> recent store writes");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  log hf on/off -> enable/disable high-frequency logs");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  quit     -> shut down (pending reverts are sent first)");
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  help     -> show this menu");
}

bool console_normalizeLine(char *line)
{
    if (!line)
    {
        return false;
    }
    size_t len = strlen(line);
    while (len > 0 && (line[len - 1] == '\r' || line[len - 1] == '\n' || line[len - 1] == ' ' || line[len - 1] == '\t'))
    {
        len--;
    }
    line[len] = '\0';

    size_t start = 0;
    while (line[start] == ' ' || line[start] == '\t')
    {
        start++;
    }
    if (start > 0)
    {
        memmove(line, line + start, len - start + 1);
        len -= start;
    }

    for (size_t i = 0; i < len; i++)
    {
        line[i] = (char)tolower((unsigned char)line[i]);
    }
    return line[0] != '\0';
}

static void printSensors(const SyncSession &session)
{
    const SensorSnapshot &s = session.sensors();
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "sensors: temp=%.1f C humidity=%.1f %% ammonia=%.1f ppm (%s) feed=%d %% (%s)",
                      s.temperature, s.humidity, s.ammonia, toString(sensor_ammoniaStatus(s.ammonia)), s.feedLevel,
                      toString(sensor_feedStatus(s.feedLevel)));
}

static void printControls(const ConsoleContext &ctx)
{
    size_t count = 0;
    const DeviceInfo *catalog = device_catalog(count);
    const ControlState &c = ctx.session.controls();
    for (size_t i = 0; i < count; i++)
    {
        const DeviceInfo &info = catalog[i];
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  %-8s %-3s %s", info.key, c.get(info.id) ? "ON" : "off",
                          info.kind == DeviceKind::MOMENTARY ? "(momentary)" : "");
    }
}

static void printSchedule(const Schedule &schedule, const char *title)
{
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "%s:", title);
    for (size_t i = 0; i < kScheduleFieldCount; i++)
    {
        const ScheduleField field = static_cast<ScheduleField>(i);
        char hhmm[8];
        if (!time_format::formatTimeOfDay(schedule.get(field), hhmm, sizeof(hhmm)))
        {
            strcpy(hhmm, "--:--");
        }
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  %-10s %s", toString(field), hhmm);
    }
}

static void printEventLog(const SyncSession &session)
{
    const std::deque<LogEntry> &entries = session.events().entries();
    if (entries.empty())
    {
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "event log empty");
        return;
    }
    for (const LogEntry &e : entries)
    {
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  #%u %s [%s] %s", (unsigned)e.id, e.time.c_str(), toString(e.severity),
                          e.message.c_str());
    }
}

static void printWrites(const MemoryStore &store)
{
    const std::deque<WriteRecord> &history = store.writeHistory();
    if (history.empty())
    {
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "no writes yet");
        return;
    }
    for (const WriteRecord &w : history)
    {
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "  %s = %s -> %s", w.path.c_str(), w.json.c_str(),
                          w.ok ? "ok" : w.reason.c_str());
    }
}

static ConsoleResult usage()
{
    console_printHelp();
    return ConsoleResult::USAGE;
}

ConsoleResult console_handleLine(ConsoleContext &ctx, const char *input)
{
    char line[FARMLINK_CFG_CONSOLE_BUF];
    strncpy(line, input ? input : "", sizeof(line));
    line[sizeof(line) - 1] = '\0';
    if (!console_normalizeLine(line))
    {
        return ConsoleResult::EMPTY;
    }

    char *save = nullptr;
    const char *cmd = strtok_r(line, kConsoleDelims, &save);
    const char *arg1 = strtok_r(nullptr, kConsoleDelims, &save);
    const char *arg2 = strtok_r(nullptr, kConsoleDelims, &save);
    SyncSession &session = ctx.session;

    if (strcmp(cmd, "help") == 0)
    {
        console_printHelp();
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "status") == 0)
    {
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "session: %s (applied=%u rejected=%u) store: %s, %u write(s) queued",
                          toString(session.phase()), (unsigned)session.snapshotsApplied(),
                          (unsigned)session.rejectedPayloads(), ctx.store.isOnline() ? "online" : "offline",
                          (unsigned)ctx.store.pendingWrites());
        FARMLINK_LOG_INFO(LogDomain::SYSTEM, "auth: %s (%u attempt(s))",
                          ctx.auth.isSignedIn() ? ctx.auth.uid().c_str() : "signed out",
                          (unsigned)ctx.auth.signInAttempts());
        printSensors(session);
        printControls(ctx);
        printSchedule(session.schedule(), "schedule");
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "sensors") == 0)
    {
        printSensors(session);
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "controls") == 0)
    {
        printControls(ctx);
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "schedule") == 0)
    {
        printSchedule(session.schedule(), "schedule");
        if (session.scheduleDirty())
        {
            printSchedule(session.scheduleDraft(), "draft (unsaved)");
        }
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "toggle") == 0 || strcmp(cmd, "pulse") == 0)
    {
        Device device;
        if (!arg1 || arg2 || !device_fromKey(arg1, device))
        {
            return usage();
        }
        const bool isPulse = cmd[0] == 'p';
        if (isPulse != device_isMomentary(device))
        {
            FARMLINK_LOG_WARN(LogDomain::SYSTEM, "%s cannot be %s", arg1, isPulse ? "pulsed" : "toggled");
            return usage();
        }
        const bool sent = isPulse ? session.pulse(device) : session.toggle(device);
        return sent ? ConsoleResult::OK : ConsoleResult::REFUSED;
    }

    if (strcmp(cmd, "set") == 0)
    {
        ScheduleField field;
        TimeOfDay value;
        if (!arg1 || !arg2 || !domain_strings::scheduleField_fromKey(arg1, field) ||
            !time_format::parseTimeOfDay(arg2, value))
        {
            return usage();
        }
        return session.setScheduleField(field, value) ? ConsoleResult::OK : ConsoleResult::REFUSED;
    }

    if (strcmp(cmd, "save") == 0)
    {
        return session.saveSchedule() ? ConsoleResult::OK : ConsoleResult::REFUSED;
    }

    if (strcmp(cmd, "log") == 0)
    {
        if (!arg1)
        {
            printEventLog(session);
            return ConsoleResult::OK;
        }
        if (strcmp(arg1, "hf") == 0 && arg2 && (strcmp(arg2, "on") == 0 || strcmp(arg2, "off") == 0))
        {
            const bool enabled = strcmp(arg2, "on") == 0;
            logger_setHighFreqEnabled(enabled);
            FARMLINK_LOG_INFO(LogDomain::SYSTEM, "High-frequency logs %s", enabled ? "enabled" : "disabled");
            return ConsoleResult::OK;
        }
        return usage();
    }

    if (strcmp(cmd, "clear") == 0)
    {
        session.clearLog();
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "auth") == 0)
    {
        return session.signIn() ? ConsoleResult::OK : ConsoleResult::REFUSED;
    }

    if (strcmp(cmd, "sim") == 0)
    {
        SimMode mode;
        if (!arg1 || !simMode_fromString(arg1, mode))
        {
            return usage();
        }
        if (!ctx.simulator)
        {
            FARMLINK_LOG_WARN(LogDomain::SYSTEM, "simulation disabled");
            return ConsoleResult::REFUSED;
        }
        ctx.simulator->setMode(mode);
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "offline") == 0 || strcmp(cmd, "online") == 0)
    {
        ctx.store.setOnline(cmd[1] == 'n');
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "writes") == 0)
    {
        printWrites(ctx.store);
        return ConsoleResult::OK;
    }

    if (strcmp(cmd, "quit") == 0 || strcmp(cmd, "exit") == 0)
    {
        return ConsoleResult::QUIT;
    }

    FARMLINK_LOG_WARN(LogDomain::SYSTEM, "unknown command '%s'", cmd);
    console_printHelp();
    return ConsoleResult::UNKNOWN;
}

} // namespace farmlink
