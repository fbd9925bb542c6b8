#include <cstring>

#include "farmlink/console.h"
#include "farmlink/logger.h"
#include "test_support.h"

using namespace farmlink;

static uint64_t fixedWallClock()
{
    return 1700000000000ull;
}

static LocalAuthOptions existingSession(bool existing)
{
    LocalAuthOptions o;
    o.existingSession = existing;
    o.failAttempts = existing ? 0 : 10;
    o.retryMs = 0;
    return o;
}

struct Rig
{
    explicit Rig(bool signedIn, bool withSimulator)
        : auth(clock, existingSession(signedIn)), simulator(store, clock, SimMode::NORMAL, 2000),
          ctx{session, store, auth, withSimulator ? &simulator : nullptr}
    {
        session.begin();
        auth.poll();
    }

    ManualClock clock;
    TaskScheduler scheduler{clock};
    MemoryStore store;
    LocalAuth auth;
    EventLog events{nullptr, fixedWallClock};
    DeviceController devices{store, events, scheduler};
    ScheduleManager schedule{store, events};
    SyncSession session{store, auth, events, devices, schedule};
    ControllerSimulator simulator;
    ConsoleContext ctx;
};

static void test_normalize_line()
{
    char line[32];
    std::strcpy(line, "  Pulse FEED \r\n");
    EXPECT_TRUE(console_normalizeLine(line));
    EXPECT_EQ_STR(line, "pulse feed");

    std::strcpy(line, " \t ");
    EXPECT_FALSE(console_normalizeLine(line));
    EXPECT_FALSE(console_normalizeLine(nullptr));
}

static void test_device_commands()
{
    Rig rig(true, false);
    EXPECT_TRUE(rig.session.isActive());

    EXPECT_TRUE(console_handleLine(rig.ctx, "  TOGGLE Heater ") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "pulse stepper2") == ConsoleResult::OK);
    EXPECT_EQ_INT(rig.store.pendingWrites(), 2);

    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle feed") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "pulse fan") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle pump") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle fan now") == ConsoleResult::USAGE);
    EXPECT_EQ_INT(rig.store.pendingWrites(), 2);

    EXPECT_EQ_INT(rig.store.poll(), 2);
    EXPECT_EQ_STR(rig.events.entries().front().message, "Activated STEPPER2");
}

static void test_schedule_commands()
{
    Rig rig(true, false);
    EXPECT_TRUE(console_handleLine(rig.ctx, "set egg_time 10:15") == ConsoleResult::OK);
    EXPECT_EQ_INT(rig.session.scheduleDraft().get(ScheduleField::EGG_TIME).hour, 10);
    EXPECT_TRUE(console_handleLine(rig.ctx, "set egg_time 25:00") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "set dinner 10:00") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(rig.ctx, "set led_on") == ConsoleResult::USAGE);

    EXPECT_TRUE(console_handleLine(rig.ctx, "save") == ConsoleResult::OK);
    EXPECT_EQ_INT(rig.store.poll(), 1);
    EXPECT_EQ_STR(rig.events.entries().front().message, "Schedule updated successfully");

    std::string json;
    EXPECT_TRUE(rig.store.read("schedule/egg_time", json));
    EXPECT_EQ_STR(json, "\"10:15\"");
}

static void test_commands_refused_before_sign_in()
{
    Rig rig(false, false);
    EXPECT_TRUE(rig.session.phase() == SessionPhase::AUTHENTICATING);
    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle fan") == ConsoleResult::REFUSED);
    EXPECT_TRUE(console_handleLine(rig.ctx, "save") == ConsoleResult::REFUSED);
    EXPECT_TRUE(console_handleLine(rig.ctx, "auth") == ConsoleResult::REFUSED);

    rig.auth.poll();
    EXPECT_TRUE(console_handleLine(rig.ctx, "auth") == ConsoleResult::OK);
    EXPECT_EQ_INT(rig.store.pendingWrites(), 0);
}

static void test_log_and_store_commands()
{
    Rig rig(true, false);
    EXPECT_FALSE(rig.events.empty());
    EXPECT_TRUE(console_handleLine(rig.ctx, "log") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "clear") == ConsoleResult::OK);
    EXPECT_TRUE(rig.events.empty());

    EXPECT_TRUE(console_handleLine(rig.ctx, "log hf off") == ConsoleResult::OK);
    EXPECT_FALSE(logger_isHighFreqEnabled());
    EXPECT_TRUE(console_handleLine(rig.ctx, "log hf on") == ConsoleResult::OK);
    EXPECT_TRUE(logger_isHighFreqEnabled());
    EXPECT_TRUE(console_handleLine(rig.ctx, "log hf maybe") == ConsoleResult::USAGE);

    EXPECT_TRUE(console_handleLine(rig.ctx, "offline") == ConsoleResult::OK);
    EXPECT_FALSE(rig.store.isOnline());
    EXPECT_TRUE(console_handleLine(rig.ctx, "toggle led") == ConsoleResult::OK);
    EXPECT_EQ_INT(rig.store.poll(), 1);
    EXPECT_EQ_STR(rig.events.entries().front().message, "Failed to toggle led: network offline");
    EXPECT_TRUE(console_handleLine(rig.ctx, "online") == ConsoleResult::OK);
    EXPECT_TRUE(rig.store.isOnline());
    EXPECT_TRUE(console_handleLine(rig.ctx, "writes") == ConsoleResult::OK);

    EXPECT_TRUE(console_handleLine(rig.ctx, "status") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "sensors") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "controls") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "schedule") == ConsoleResult::OK);
    EXPECT_TRUE(console_handleLine(rig.ctx, "help") == ConsoleResult::OK);
}

static void test_simulation_command()
{
    Rig without(true, false);
    EXPECT_TRUE(console_handleLine(without.ctx, "sim silent") == ConsoleResult::REFUSED);

    Rig with(true, true);
    EXPECT_TRUE(console_handleLine(with.ctx, "sim malformed") == ConsoleResult::OK);
    EXPECT_TRUE(with.simulator.mode() == SimMode::MALFORMED);
    EXPECT_TRUE(console_handleLine(with.ctx, "sim chaos") == ConsoleResult::USAGE);
    EXPECT_TRUE(console_handleLine(with.ctx, "sim") == ConsoleResult::USAGE);
}

static void test_misc_results()
{
    Rig rig(true, false);
    EXPECT_TRUE(console_handleLine(rig.ctx, "") == ConsoleResult::EMPTY);
    EXPECT_TRUE(console_handleLine(rig.ctx, nullptr) == ConsoleResult::EMPTY);
    EXPECT_TRUE(console_handleLine(rig.ctx, "bogus") == ConsoleResult::UNKNOWN);
    EXPECT_TRUE(console_handleLine(rig.ctx, "QUIT") == ConsoleResult::QUIT);
    EXPECT_EQ_STR(consoleResultName(ConsoleResult::REFUSED), "refused");
}

int main()
{
    logger_begin(true, false);
    test_normalize_line();
    test_device_commands();
    test_schedule_commands();
    test_commands_refused_before_sign_in();
    test_log_and_store_commands();
    test_simulation_command();
    test_misc_results();
    return finishTests("console");
}
