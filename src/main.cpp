#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <string>
#include <time.h>
#include <unistd.h>

#include "farmlink/app_config.h"
#include "farmlink/config.h"
#include "farmlink/console.h"
#include "farmlink/device_controller.h"
#include "farmlink/event_log.h"
#include "farmlink/local_auth.h"
#include "farmlink/logger.h"
#include "farmlink/memory_store.h"
#include "farmlink/notifier.h"
#include "farmlink/schedule_manager.h"
#include "farmlink/simulation.h"
#include "farmlink/sync_session.h"
#include "farmlink/task_scheduler.h"

using namespace farmlink;

static volatile sig_atomic_t s_stopRequested = 0;
static bool s_quit = false;
static bool s_stdinOpen = true;
static std::string s_stdinPending;

static SteadyClock *g_clock = nullptr;
static MemoryStore *g_store = nullptr;
static LocalAuth *g_auth = nullptr;
static TaskScheduler *g_scheduler = nullptr;
static SyncSession *g_session = nullptr;
static ControllerSimulator *g_simulator = nullptr;
static ConsoleContext *g_console = nullptr;

struct LoopWindow
{
    const char *name;
    uint32_t intervalMs;
    uint64_t lastMs;
    void (*fn)();
};

static void runWindow(LoopWindow &w, uint64_t now)
{
    if (w.intervalMs == 0 || now - w.lastMs >= w.intervalMs)
    {
        w.fn();
        w.lastMs = now;
    }
}

static void onSignal(int)
{
    s_stopRequested = 1;
}

// Reads one complete line from stdin without blocking. Returns false when none is ready.
static bool readConsoleLine(char *buf, size_t bufSize)
{
    if (!buf || bufSize < 2)
    {
        return false;
    }

    while (s_stdinOpen)
    {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = poll(&pfd, 1, 0);
        if (ready < 0 && errno == EINTR)
        {
            break;
        }
        if (ready <= 0)
        {
            break;
        }

        char chunk[FARMLINK_CFG_CONSOLE_BUF];
        const ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR)
        {
            break;
        }
        if (n <= 0)
        {
            FARMLINK_LOG_INFO(LogDomain::SYSTEM, "stdin closed, console input disabled");
            s_stdinOpen = false;
            break;
        }
        s_stdinPending.append(chunk, (size_t)n);
    }

    const size_t nl = s_stdinPending.find('\n');
    if (nl == std::string::npos)
    {
        return false;
    }
    const size_t len = nl < bufSize - 1 ? nl : bufSize - 1;
    memcpy(buf, s_stdinPending.data(), len);
    buf[len] = '\0';
    s_stdinPending.erase(0, nl + 1);
    return true;
}

static void windowConsole()
{
    char line[FARMLINK_CFG_CONSOLE_BUF];
    while (readConsoleLine(line, sizeof(line)))
    {
        if (console_handleLine(*g_console, line) == ConsoleResult::QUIT)
        {
            s_quit = true;
            return;
        }
    }
}

static void windowAuth()
{
    g_auth->poll();
}

static void windowStore()
{
    g_store->poll();
    g_session->poll();
}

static void windowTimers()
{
    g_scheduler->runDue();
}

static void windowSimulator()
{
    if (g_simulator)
    {
        g_simulator->tick();
    }
}

static LoopWindow g_windows[] = {
    {"CONSOLE", 50u, 0u, windowConsole},
    {"AUTH", 0u, 0u, windowAuth},
    {"STORE", 0u, 0u, windowStore},
    {"TIMERS", 0u, 0u, windowTimers},
    {"SIM", 100u, 0u, windowSimulator}};

static void sleepMs(uint32_t ms)
{
    struct timespec ts;
    ts.tv_sec = ms / 1000u;
    ts.tv_nsec = (long)(ms % 1000u) * 1000000L;
    while (nanosleep(&ts, &ts) != 0 && errno == EINTR && !s_stopRequested)
    {
    }
}

// Contract: runs after the loop exits. Reverts go out before the process ends.
static void appShutdown(DeviceController &devices)
{
    g_session->terminate();
    const size_t flushed = devices.flushPendingReverts();
    // Confirming an activation queues its revert, which the next poll delivers.
    size_t written = 0;
    while (g_store->pendingWrites() > 0)
    {
        written += g_store->poll();
    }
    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "shutdown: %u revert(s) flushed, %u write(s) delivered", (unsigned)flushed,
                      (unsigned)written);
}

int main(int argc, char **argv)
{
    AppConfig cfg;
    const char *configPath = argc > 1 ? argv[1] : FARMLINK_CFG_CONFIG_PATH;

    logger_begin(true, cfg.logColor);
    const ConfigError cfgErr = appConfig_load(configPath, cfg);
    if (cfgErr != ConfigError::OK && cfgErr != ConfigError::NOT_FOUND)
    {
        FARMLINK_LOG_WARN(LogDomain::CONFIG, "continuing with defaults (%s)", configErrorName(cfgErr));
    }
    logger_setColorEnabled(cfg.logColor);
    logger_setHighFreqEnabled(cfg.logHighFreq);

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0)
    {
        FARMLINK_LOG_WARN(LogDomain::SYSTEM, "signal handlers not installed: %s", strerror(errno));
    }

    SteadyClock clock;
    MemoryStore store;
    TaskScheduler scheduler(clock);
    TerminalNotifier notifier(cfg.notificationsEnabled);
    EventLog events(&notifier);
    events.setNotifyTitle(cfg.notifyTitle);

    LocalAuthOptions authOptions;
    authOptions.existingSession = cfg.authExistingSession;
    authOptions.failAttempts = cfg.authFailAttempts;
    authOptions.retryMs = cfg.authRetryMs;
    LocalAuth auth(clock, authOptions);

    DeviceController devices(store, events, scheduler);
    ScheduleManager scheduleManager(store, events);
    SyncSession session(store, auth, events, devices, scheduleManager);

    ControllerSimulator simulator(store, clock, cfg.simulationMode, cfg.simulationIntervalMs);
    ConsoleContext console{session, store, auth, cfg.simulationEnabled ? &simulator : nullptr};

    g_clock = &clock;
    g_store = &store;
    g_auth = &auth;
    g_scheduler = &scheduler;
    g_session = &session;
    g_console = &console;
    if (!memoryStore_seedDefaults(store))
    {
        FARMLINK_LOG_ERROR(LogDomain::SYSTEM, "store could not be initialised");
        return 1;
    }
    if (cfg.simulationEnabled)
    {
        if (simulator.begin())
        {
            g_simulator = &simulator;
        }
        else
        {
            console.simulator = nullptr;
        }
    }

    FARMLINK_LOG_INFO(LogDomain::SYSTEM, "farmlink console starting (config=%s, simulation=%s)", configPath,
                      g_simulator ? simMode_name(cfg.simulationMode) : "off");
    console_printHelp();
    if (!session.begin())
    {
        FARMLINK_LOG_ERROR(LogDomain::SYSTEM, "session did not start");
        return 1;
    }

    while (!s_quit && !s_stopRequested)
    {
        const uint64_t now = g_clock->nowMs();
        for (LoopWindow &w : g_windows)
        {
            runWindow(w, now);
        }
        sleepMs(FARMLINK_CFG_LOOP_SLEEP_MS);
    }

    appShutdown(devices);
    return 0;
}
